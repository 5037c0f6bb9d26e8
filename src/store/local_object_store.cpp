#include "stager/store/local_object_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <functional>
#include <system_error>
#include <thread>

namespace stager::store {
namespace fs = std::filesystem;

namespace {

class LocalWritableObject : public WritableObject {
public:
    LocalWritableObject(fs::path temp_path, fs::path final_path, std::ofstream output)
        : temp_path_(std::move(temp_path)),
          final_path_(std::move(final_path)),
          output_(std::move(output)) {}

    ~LocalWritableObject() override {
        if (committed_) {
            return;
        }
        output_.close();
        std::error_code ec;
        fs::remove(temp_path_, ec);
        if (ec) {
            spdlog::warn("Failed to discard temporary object {}: {}", temp_path_.string(), ec.message());
        }
    }

    stager::Result<void> write(const std::uint8_t* data, std::size_t size) override {
        if (committed_) {
            return stager::Err<void>(ErrorKind::StoreError,
                                     std::string("Object already committed: ") + final_path_.string());
        }
        output_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!output_) {
            return stager::Err<void>(ErrorKind::StoreError,
                                     std::string("Failed to write object: ") + final_path_.string());
        }
        return stager::Ok();
    }

    stager::Result<void> commit() override {
        if (committed_) {
            return stager::Ok();
        }
        output_.flush();
        output_.close();
        if (output_.fail()) {
            return stager::Err<void>(ErrorKind::StoreError,
                                     std::string("Failed to flush object: ") + final_path_.string());
        }

        std::error_code ec;
        fs::rename(temp_path_, final_path_, ec);
        if (ec) {
            return stager::Err<void>(ErrorKind::StoreError,
                                     std::string("Failed to move object into place: ") + final_path_.string() +
                                     " (" + ec.message() + ")");
        }
        committed_ = true;
        return stager::Ok();
    }

private:
    fs::path temp_path_;
    fs::path final_path_;
    std::ofstream output_;
    bool committed_ = false;
};

} // namespace

fs::path LocalObjectStore::path_for_key(const std::string& key) {
    const std::string scheme(kFileScheme);
    if (key.compare(0, scheme.size(), scheme) == 0) {
        return fs::path(key.substr(scheme.size()));
    }
    return fs::path(key);
}

stager::Result<bool> LocalObjectStore::exists(const std::string& key) {
    const auto path = path_for_key(key);
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        return stager::Err<bool>(ErrorKind::StoreError,
                                 std::string("Failed to stat object: ") + path.string() + " (" + ec.message() + ")");
    }
    return stager::Ok(fs::is_regular_file(status));
}

stager::Result<std::unique_ptr<WritableObject>> LocalObjectStore::create(const std::string& key,
                                                                         const staging::CreateOptions& options) {
    const auto final_path = path_for_key(key);
    if (final_path.filename().empty()) {
        return stager::Err<std::unique_ptr<WritableObject>>(ErrorKind::StoreError,
                                                            std::string("Invalid object key: ") + key);
    }
    if (auto res = ensure_parent_exists(final_path); res.is_error()) {
        return stager::Err<std::unique_ptr<WritableObject>>(res.error());
    }

    const auto id = temp_counter_.fetch_add(1);
    const auto thread_tag = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path temp_path = final_path.parent_path() /
        ("." + final_path.filename().string() + ".tmp-" + std::to_string(thread_tag) + "-" + std::to_string(id));

    std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return stager::Err<std::unique_ptr<WritableObject>>(ErrorKind::StoreError,
                                                            std::string("Failed to create object: ") + temp_path.string());
    }

    spdlog::debug("Creating object {} content_type={}", final_path.string(), options.content_type);
    return stager::Ok<std::unique_ptr<WritableObject>>(
        std::make_unique<LocalWritableObject>(std::move(temp_path), final_path, std::move(output)));
}

stager::Result<void> LocalObjectStore::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return stager::Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return stager::Err<void>(ErrorKind::StoreError,
                                 std::string("Failed to create directory: ") + parent.string());
    }
    return stager::Ok();
}

} // namespace stager::store
