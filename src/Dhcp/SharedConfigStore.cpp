#include "PiNet/Dhcp/SharedConfigStore.hpp"
#include "PiNet/Util/Logger.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

using tl::unexpected, std::string, std::string_view, std::vector, std::format;
namespace fs = std::filesystem;

namespace PiNet
{
    SharedConfigStore::SharedConfigStore(string path) : path_(std::move(path))
    {
        s_ = logger().get_sink("PiNet ConfigStore");
    }

    string SharedConfigStore::backup_path() const
    {
        return path_ + ".backup";
    }

    tl::expected<string, Error> SharedConfigStore::read() const
    {
        std::error_code ec;
        if (!fs::exists(path_, ec))
        {
            XTR_LOGL(debug, s_, "{} does not exist yet, treating as empty", path_);
            return string();
        }

        std::ifstream in(path_, std::ios::binary);
        if (!in)
        {
            XTR_LOGL(error, s_, "Failed to open {} for reading", path_);
            return unexpected(Error{ErrorCode::ConfigReadError, format("Failed to open {} for reading", path_)});
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad())
        {
            return unexpected(Error{ErrorCode::ConfigReadError, format("Failed to read {}", path_)});
        }
        return buffer.str();
    }

    tl::expected<void, Error> SharedConfigStore::write(const string& text) const
    {
        std::error_code ec;
        if (fs::exists(path_, ec))
        {
            fs::copy_file(path_, backup_path(), fs::copy_options::overwrite_existing, ec);
            if (ec)
            {
                XTR_LOGL(error, s_, "Failed to back up {}: {}", path_, ec.message());
                return unexpected(Error{
                    ErrorCode::ConfigBackupError, format("Failed to back up {}: {}", path_, ec.message())
                });
            }
        }

        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            XTR_LOGL(error, s_, "Failed to open {} for writing", path_);
            return unexpected(Error{ErrorCode::ConfigWriteError, format("Failed to open {} for writing", path_)});
        }
        out << text;
        out.flush();
        if (!out)
        {
            XTR_LOGL(error, s_, "Failed to write {}", path_);
            return unexpected(Error{ErrorCode::ConfigWriteError, format("Failed to write {}", path_)});
        }
        XTR_LOGL(info, s_, "Updated {} ({} bytes)", path_, text.size());
        return {};
    }

    tl::expected<ConfigDocument, Error> SharedConfigStore::load() const
    {
        return read().map([](const string& text) { return ConfigDocument::parse(text); });
    }

    tl::expected<bool, Error> SharedConfigStore::update(const Mutation& mutate) const
    {
        auto document = load();
        if (!document)
        {
            return unexpected(document.error());
        }

        const string before = document->serialize();
        mutate(*document);
        const string after = document->serialize();
        if (after == before)
        {
            XTR_LOGL(debug, s_, "{} already up to date", path_);
            return false;
        }

        if (auto written = write(after); !written)
        {
            return unexpected(written.error());
        }
        return true;
    }

    tl::expected<bool, Error> SharedConfigStore::upsert_block(const string_view marker,
                                                               const vector<string>& body) const
    {
        return update([&](ConfigDocument& document) { document.upsert_block(marker, body); });
    }

    tl::expected<bool, Error> SharedConfigStore::remove_block(const string_view marker) const
    {
        return update([&](ConfigDocument& document) { document.remove_block(marker); });
    }

    tl::expected<bool, Error> SharedConfigStore::has_line(const string_view line) const
    {
        return load().map([line](const ConfigDocument& document) { return document.contains(line); });
    }

    tl::expected<bool, Error> SharedConfigStore::ensure_singleton_line(const string_view line) const
    {
        return update([&](ConfigDocument& document) { document.ensure_singleton(line); });
    }

    tl::expected<bool, Error> SharedConfigStore::remove_line(const string_view line) const
    {
        return update([&](ConfigDocument& document) { document.remove_line(line); });
    }
}
