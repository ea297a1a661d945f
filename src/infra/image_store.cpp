#include "cr/storage.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace cr {

ImageStore::ImageStore(fs::path root)
    : root_(std::move(root))
{}

bool ImageStore::prepare(std::string& error) const
{
    if (root_.empty())
    {
        error = "image directory cannot be empty";
        return false;
    }
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec)
    {
        error = "failed to create image directory '" + root_.string() + "': " + ec.message();
        return false;
    }
    return true;
}

StoreResult ImageStore::write(const std::vector<std::uint8_t>& bytes, const std::string& filename) const
{
    StoreResult res{};
    if (filename.empty() || filename.find('/') != std::string::npos ||
        filename == "." || filename == "..")
    {
        res.error = "invalid filename '" + filename + "'";
        return res;
    }
    if (!prepare(res.error)) return res;

    const fs::path path = root_ / filename;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        res.error = "failed to open '" + path.string() + "' for writing";
        return res;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out)
    {
        res.error = "failed while writing '" + path.string() + "'";
        return res;
    }
    res.ok = true;
    res.path = path.string();
    return res;
}

} // namespace cr
