#include "engine/store_file_ops.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace histscrub {

bool StoreFileOps::exists(const std::filesystem::path &path) const
{
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool StoreFileOps::copyFile(const std::filesystem::path &from,
                            const std::filesystem::path &to,
                            std::string &error)
{
    std::error_code ec;
    std::filesystem::copy_file(from, to,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "copy " + from.string() + " -> " + to.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool StoreFileOps::removeFile(const std::filesystem::path &path, std::string &error)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        error = "remove " + path.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool StoreFileOps::renameFile(const std::filesystem::path &from,
                              const std::filesystem::path &to,
                              std::string &error)
{
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        error = "move " + from.string() + " -> " + to.string() + ": " + ec.message();
        return false;
    }
    return true;
}

std::filesystem::path sidecarPath(const std::filesystem::path &store, const char *suffix)
{
    std::filesystem::path sidecar = store;
    sidecar += suffix;
    return sidecar;
}

std::string newTransientToken()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << dist(gen);
    return out.str();
}

std::filesystem::path transientPath(const std::filesystem::path &store,
                                    const std::string &token,
                                    const char *suffix)
{
    std::filesystem::path path = store;
    path += kTransientTag;
    path += token;
    path += suffix;
    return path;
}

} // namespace histscrub
