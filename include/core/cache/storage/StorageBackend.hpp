#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

namespace infercache {
namespace core {
namespace cache {
namespace storage {

// Файл в области хранения
struct StoredFile {
    std::string name;
    size_t sizeBytes = 0;
};

/**
 * @brief Байтовое долговременное хранилище с семантикой каталога
 *
 * Все методы при ошибке ввода-вывода бросают
 * common::InferenceError(ErrorKind::StorageUnavailable).
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Подготовка области хранения (создание каталога)
    virtual void prepare() = 0;
    // Атомарная запись: читатели видят либо старое, либо новое содержимое
    virtual void writeFile(const std::string& name, const std::vector<uint8_t>& data) = 0;
    // std::nullopt, если файла нет
    virtual std::optional<std::vector<uint8_t>> readFile(const std::string& name) = 0;
    // Удаление отсутствующего файла не является ошибкой
    virtual void deleteFile(const std::string& name) = 0;
    virtual std::vector<StoredFile> listFiles() = 0;
    // Проверка наличия файла
    virtual bool exists(const std::string& name) { return readFile(name).has_value(); }
    // Удаление брошенных временных файлов старше minAge, возвращает их число
    virtual size_t purgeTemporaryFiles(std::chrono::seconds minAge) { (void)minAge; return 0; }
};

// Реализация поверх локальной файловой системы
class FileSystemStorage : public StorageBackend {
public:
    explicit FileSystemStorage(std::filesystem::path root);

    void prepare() override;
    void writeFile(const std::string& name, const std::vector<uint8_t>& data) override;
    std::optional<std::vector<uint8_t>> readFile(const std::string& name) override;
    void deleteFile(const std::string& name) override;
    std::vector<StoredFile> listFiles() override;
    bool exists(const std::string& name) override;
    size_t purgeTemporaryFiles(std::chrono::seconds minAge) override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path pathFor(const std::string& name) const;

    std::filesystem::path root_;
};

} // namespace storage
} // namespace cache
} // namespace core
} // namespace infercache
