#include "persist/vlock_snapshot.hpp"
#include "storage/vlock_record_store.hpp"
#include "vlock_logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace vlock {

// 单个键或值的长度上限，防止损坏的文件导致巨大分配
static const uint64_t MAX_FIELD_LENGTH = 512ULL * 1024 * 1024;

bool SnapshotPersistence::saveToFile(const RecordStore& store, const std::string& filename) {
    const std::string tmp_filename = filename + ".tmp";
    std::vector<Record> records = store.snapshot();

    {
        std::ofstream file(tmp_filename, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            VLOCK_LOG_ERROR("Failed to open snapshot file ", tmp_filename, " for writing");
            return false;
        }

        if (!writeHeader(file)) {
            VLOCK_LOG_ERROR("Failed to write snapshot header to ", tmp_filename);
            return false;
        }

        writeUint64(file, static_cast<uint64_t>(records.size()));
        for (const auto& record : records) {
            if (!writeRecord(file, record)) {
                VLOCK_LOG_ERROR("Failed to write record ", record.key, " to ", tmp_filename);
                return false;
            }
        }
        file.flush();
        if (!file.good()) {
            VLOCK_LOG_ERROR("Failed to flush snapshot file ", tmp_filename);
            return false;
        }
    }

    if (std::rename(tmp_filename.c_str(), filename.c_str()) != 0) {
        VLOCK_LOG_ERROR("Failed to rename ", tmp_filename, " to ", filename, ": ", std::strerror(errno));
        std::remove(tmp_filename.c_str());
        return false;
    }

    VLOCK_LOG_INFO("Saved ", records.size(), " records to snapshot file: ", filename);
    return true;
}

bool SnapshotPersistence::loadFromFile(RecordStore& store, const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        VLOCK_LOG_ERROR("Failed to open snapshot file ", filename, " for reading");
        return false;
    }

    if (!readHeader(file)) {
        return false;
    }

    uint64_t count = 0;
    if (!readUint64(file, count)) {
        VLOCK_LOG_ERROR("Truncated snapshot file: ", filename);
        return false;
    }

    // 先完整解析，再写入存储，避免半个快照生效
    std::vector<Record> records;
    for (uint64_t i = 0; i < count; ++i) {
        Record record;
        if (!readRecord(file, record)) {
            VLOCK_LOG_ERROR("Corrupted record #", i, " in snapshot file: ", filename);
            return false;
        }
        records.push_back(std::move(record));
    }

    for (const auto& record : records) {
        store.restore(record);
    }

    VLOCK_LOG_INFO("Loaded ", records.size(), " records from snapshot file: ", filename);
    return true;
}

bool SnapshotPersistence::writeHeader(std::ofstream& file) {
    file.write(SNAPSHOT_MAGIC_STRING, static_cast<std::streamsize>(strlen(SNAPSHOT_MAGIC_STRING)));
    writeUint64(file, SNAPSHOT_FORMAT_VERSION);
    return file.good();
}

bool SnapshotPersistence::readHeader(std::ifstream& file) {
    const size_t magic_len = strlen(SNAPSHOT_MAGIC_STRING);
    std::string magic(magic_len, '\0');
    file.read(&magic[0], static_cast<std::streamsize>(magic_len));
    if (!file.good() || magic != SNAPSHOT_MAGIC_STRING) {
        VLOCK_LOG_ERROR("Invalid snapshot file format");
        return false;
    }

    uint64_t version = 0;
    if (!readUint64(file, version) || version != SNAPSHOT_FORMAT_VERSION) {
        VLOCK_LOG_ERROR("Unsupported snapshot version: ", version, ", expected: ", SNAPSHOT_FORMAT_VERSION);
        return false;
    }
    return true;
}

bool SnapshotPersistence::writeRecord(std::ofstream& file, const Record& record) {
    writeString(file, record.key);
    writeString(file, record.payload);
    writeUint64(file, record.version);
    return file.good();
}

bool SnapshotPersistence::readRecord(std::ifstream& file, Record& record) {
    if (!readString(file, record.key) || !readString(file, record.payload)) {
        return false;
    }
    if (!readUint64(file, record.version)) {
        return false;
    }
    // 持久化的记录版本号从1开始
    return record.version != NO_VERSION;
}

void SnapshotPersistence::writeString(std::ofstream& file, const std::string& str) {
    writeUint64(file, static_cast<uint64_t>(str.size()));
    file.write(str.data(), static_cast<std::streamsize>(str.size()));
}

bool SnapshotPersistence::readString(std::ifstream& file, std::string& str) {
    uint64_t length = 0;
    if (!readUint64(file, length) || length > MAX_FIELD_LENGTH) {
        return false;
    }
    str.assign(static_cast<size_t>(length), '\0');
    if (length > 0) {
        file.read(&str[0], static_cast<std::streamsize>(length));
    }
    return file.good();
}

void SnapshotPersistence::writeUint64(std::ofstream& file, uint64_t value) {
    unsigned char buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFF);
    }
    file.write(reinterpret_cast<const char*>(buf), sizeof(buf));
}

bool SnapshotPersistence::readUint64(std::ifstream& file, uint64_t& value) {
    unsigned char buf[8];
    file.read(reinterpret_cast<char*>(buf), sizeof(buf));
    if (!file.good()) {
        return false;
    }
    value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(buf[i]) << (8 * i);
    }
    return true;
}

} // namespace vlock
