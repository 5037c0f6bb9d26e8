#include "stager/staging/resource.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace stager::staging {
namespace fs = std::filesystem;

namespace {

stager::Result<void> check_readable(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return stager::Err<void>(ErrorKind::InvalidResourceSpec,
                                 std::string("Source does not exist: ") + path.string());
    }
    if (!fs::is_regular_file(status)) {
        return stager::Err<void>(ErrorKind::InvalidResourceSpec,
                                 std::string("Source is not a regular file: ") + path.string());
    }

    std::ifstream probe(path, std::ios::binary);
    if (!probe) {
        return stager::Err<void>(ErrorKind::InvalidResourceSpec,
                                 std::string("Source is not readable: ") + path.string());
    }
    return stager::Ok();
}

} // namespace

stager::Result<ResourceSpec> resolve_resource(const std::string& entry) {
    if (entry.empty()) {
        return stager::Err<ResourceSpec>(ErrorKind::InvalidResourceSpec, "Empty resource entry");
    }

    std::string name;
    fs::path path;
    const auto separator = entry.find('=');
    if (separator != std::string::npos) {
        name = entry.substr(0, separator);
        path = entry.substr(separator + 1);
    } else {
        path = entry;
        name = path.filename().string();
    }

    if (path.empty()) {
        return stager::Err<ResourceSpec>(ErrorKind::InvalidResourceSpec,
                                         std::string("Missing source path in entry: ") + entry);
    }
    if (name.empty()) {
        return stager::Err<ResourceSpec>(ErrorKind::InvalidResourceSpec,
                                         std::string("Cannot derive a name from entry: ") + entry);
    }

    if (auto readable = check_readable(path); readable.is_error()) {
        return stager::Err<ResourceSpec>(readable.error());
    }

    return stager::Ok(ResourceSpec{std::move(name), ResourceSource{std::move(path)}});
}

stager::Result<ResourceSpec> make_buffer_resource(ByteBuffer bytes, std::string logical_name) {
    if (logical_name.empty()) {
        return stager::Err<ResourceSpec>(ErrorKind::InvalidResourceSpec, "Buffer resource needs a name");
    }
    auto shared = std::make_shared<const ByteBuffer>(std::move(bytes));
    return stager::Ok(ResourceSpec{std::move(logical_name), ResourceSource{std::move(shared)}});
}

stager::Result<void> for_each_chunk(const ResourceSource& source,
                                    std::size_t chunk_size,
                                    const ChunkSink& sink) {
    if (chunk_size == 0) {
        return stager::Err<void>(ErrorKind::InvalidConfiguration, "chunk_size must be > 0");
    }

    if (const auto* buffer = std::get_if<std::shared_ptr<const ByteBuffer>>(&source)) {
        const ByteBuffer& bytes = **buffer;
        for (std::size_t offset = 0; offset < bytes.size(); offset += chunk_size) {
            const std::size_t count = std::min(chunk_size, bytes.size() - offset);
            auto result = sink(bytes.data() + offset, count);
            if (result.is_error()) {
                return result;
            }
        }
        return stager::Ok();
    }

    const auto& path = std::get<fs::path>(source);
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return stager::Err<void>(ErrorKind::InvalidResourceSpec,
                                 std::string("Failed to open source file: ") + path.string());
    }

    std::vector<std::uint8_t> buffer(chunk_size);
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk_size));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            break;
        }
        auto result = sink(buffer.data(), bytes_read);
        if (result.is_error()) {
            return result;
        }
    }

    if (input.bad()) {
        return stager::Err<void>(ErrorKind::InvalidResourceSpec,
                                 std::string("Failed to read source file: ") + path.string());
    }
    return stager::Ok();
}

std::string describe_source(const ResourceSource& source) {
    if (const auto* path = std::get_if<fs::path>(&source)) {
        return path->string();
    }
    const auto& buffer = std::get<std::shared_ptr<const ByteBuffer>>(source);
    return "<buffer " + std::to_string(buffer->size()) + " bytes>";
}

} // namespace stager::staging
