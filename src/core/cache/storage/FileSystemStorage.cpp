#include "core/cache/storage/StorageBackend.hpp"
#include "core/common/InferenceError.hpp"
#include <atomic>
#include <fstream>
#include <iterator>
#include <system_error>
#include <thread>
#include <sstream>

namespace infercache {
namespace core {
namespace cache {
namespace storage {

using common::ErrorKind;
using common::InferenceError;

namespace {

constexpr const char* kTempSuffix = ".tmp";

// Уникальный суффикс временного файла: параллельные записи разных ключей не пересекаются
std::string tempSuffix() {
    static std::atomic<uint64_t> counter{0};
    std::stringstream ss;
    ss << "." << std::this_thread::get_id() << "." << counter.fetch_add(1) << kTempSuffix;
    return ss.str();
}

bool isTempFile(const std::string& name) {
    const std::string suffix = kTempSuffix;
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

FileSystemStorage::FileSystemStorage(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path FileSystemStorage::pathFor(const std::string& name) const {
    if (name.empty() || name.find('/') != std::string::npos || name.find("..") != std::string::npos) {
        throw InferenceError(ErrorKind::StorageUnavailable, "Недопустимое имя файла: " + name);
    }
    return root_ / name;
}

void FileSystemStorage::prepare() {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw InferenceError(ErrorKind::StorageUnavailable,
            "Не удалось создать каталог " + root_.string() + ": " + ec.message());
    }
}

void FileSystemStorage::writeFile(const std::string& name, const std::vector<uint8_t>& data) {
    auto target = pathFor(name);
    auto temp = root_ / (name + tempSuffix());
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw InferenceError(ErrorKind::StorageUnavailable, "Не удалось открыть " + temp.string());
        }
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw InferenceError(ErrorKind::StorageUnavailable, "Ошибка записи " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw InferenceError(ErrorKind::StorageUnavailable,
            "Не удалось переименовать " + temp.string() + ": " + ec.message());
    }
}

std::optional<std::vector<uint8_t>> FileSystemStorage::readFile(const std::string& name) {
    auto path = pathFor(name);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw InferenceError(ErrorKind::StorageUnavailable, "Ошибка доступа к " + path.string());
        }
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw InferenceError(ErrorKind::StorageUnavailable, "Не удалось открыть " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw InferenceError(ErrorKind::StorageUnavailable, "Ошибка чтения " + path.string());
    }
    return data;
}

void FileSystemStorage::deleteFile(const std::string& name) {
    auto path = pathFor(name);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw InferenceError(ErrorKind::StorageUnavailable,
            "Не удалось удалить " + path.string() + ": " + ec.message());
    }
}

std::vector<StoredFile> FileSystemStorage::listFiles() {
    std::vector<StoredFile> files;
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        throw InferenceError(ErrorKind::StorageUnavailable,
            "Не удалось прочитать каталог " + root_.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc) || entryEc) continue;
        auto name = entry.path().filename().string();
        if (isTempFile(name)) continue;
        auto size = entry.file_size(entryEc);
        if (entryEc) continue;
        files.push_back({name, static_cast<size_t>(size)});
    }
    return files;
}

bool FileSystemStorage::exists(const std::string& name) {
    auto path = pathFor(name);
    std::error_code ec;
    bool found = std::filesystem::exists(path, ec);
    if (ec) {
        throw InferenceError(ErrorKind::StorageUnavailable, "Ошибка доступа к " + path.string());
    }
    return found;
}

size_t FileSystemStorage::purgeTemporaryFiles(std::chrono::seconds minAge) {
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        throw InferenceError(ErrorKind::StorageUnavailable,
            "Не удалось прочитать каталог " + root_.string() + ": " + ec.message());
    }

    // Более свежие временные файлы могут принадлежать незавершённой записи
    const auto threshold = std::filesystem::file_time_type::clock::now() - minAge;
    size_t removed = 0;
    for (const auto& entry : it) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc) || entryEc) continue;
        if (!isTempFile(entry.path().filename().string())) continue;
        auto modified = entry.last_write_time(entryEc);
        if (entryEc || modified > threshold) continue;
        if (std::filesystem::remove(entry.path(), entryEc) && !entryEc) {
            ++removed;
        }
    }
    return removed;
}

} // namespace storage
} // namespace cache
} // namespace core
} // namespace infercache
