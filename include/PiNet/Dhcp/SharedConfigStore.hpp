#ifndef PINET_DHCP_SHARED_CONFIG_STORE_HPP
#define PINET_DHCP_SHARED_CONFIG_STORE_HPP

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Dhcp/ConfigDocument.hpp"
#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    /**
     * @brief Read/modify/write access to the dnsmasq configuration file
     *
     * The file is shared with other consumers and hand edits, so every
     * mutation goes through the parsed ConfigDocument and only rewrites the
     * file when its serialized text actually changes. Each write first
     * copies the current file to "<path>.backup".
     *
     * Mutating calls return whether the file was written.
     */
    class SharedConfigStore
    {
    public:
        using Mutation = std::function<void(ConfigDocument&)>;

        explicit SharedConfigStore(std::string path);

        const std::string& path() const { return path_; }
        std::string backup_path() const;

        // A missing file reads as empty text
        tl::expected<std::string, Error> read() const;
        tl::expected<void, Error> write(const std::string& text) const;

        tl::expected<ConfigDocument, Error> load() const;
        tl::expected<bool, Error> update(const Mutation& mutate) const;

        tl::expected<bool, Error> upsert_block(std::string_view marker, const std::vector<std::string>& body) const;
        tl::expected<bool, Error> remove_block(std::string_view marker) const;
        tl::expected<bool, Error> has_line(std::string_view line) const;
        tl::expected<bool, Error> ensure_singleton_line(std::string_view line) const;
        tl::expected<bool, Error> remove_line(std::string_view line) const;

    private:
        std::string path_;
        mutable xtr::sink s_;
    };
}

#endif //PINET_DHCP_SHARED_CONFIG_STORE_HPP
