#pragma once

#include "../vlock_core.hpp"
#include <fstream>
#include <string>

namespace vlock {
class RecordStore;

// 快照文件的魔数和格式版本
constexpr const char* SNAPSHOT_MAGIC_STRING = "VLOCKSNAP";
constexpr uint32_t SNAPSHOT_FORMAT_VERSION = 1;

// 快照文件：头部之后是 (key, payload, version) 行
class SnapshotPersistence {
public:
    // 将存储中的全部记录保存到文件，先写临时文件再改名
    static bool saveToFile(const RecordStore& store, const std::string& filename);

    // 从文件加载记录到存储，文件格式错误时返回false
    static bool loadFromFile(RecordStore& store, const std::string& filename);

private:
    static bool writeHeader(std::ofstream& file);
    static bool readHeader(std::ifstream& file);

    static bool writeRecord(std::ofstream& file, const Record& record);
    static bool readRecord(std::ifstream& file, Record& record);

    // 写入字符串（长度前缀）
    static void writeString(std::ofstream& file, const std::string& str);
    static bool readString(std::ifstream& file, std::string& str);

    // 小端64位整数
    static void writeUint64(std::ofstream& file, uint64_t value);
    static bool readUint64(std::ifstream& file, uint64_t& value);
};

} // namespace vlock
