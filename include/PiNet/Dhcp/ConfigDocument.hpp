#ifndef PINET_DHCP_CONFIG_DOCUMENT_HPP
#define PINET_DHCP_CONFIG_DOCUMENT_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace PiNet
{
    /**
     * @brief One line of dnsmasq.conf
     *
     * The original text is kept verbatim so lines nobody touched serialize
     * back byte-for-byte.
     */
    struct ConfigLine
    {
        enum class Kind
        {
            Blank,
            Comment,
            Directive
        };

        Kind kind{Kind::Blank};
        std::string key;
        std::string value;
        bool has_value{false};
        std::string raw;

        static ConfigLine parse(std::string_view text);

        // Compared after trimming surrounding whitespace
        bool equals(std::string_view line) const;
    };

    /**
     * @brief dnsmasq.conf as an ordered list of typed records
     *
     * Blocks are a marker comment followed by directive lines; a block ends
     * before the next blank line or the next comment (i.e. another marker).
     */
    class ConfigDocument
    {
    public:
        static ConfigDocument parse(std::string_view text);
        std::string serialize() const;

        const std::vector<ConfigLine>& lines() const { return lines_; }
        bool empty() const { return lines_.empty(); }

        bool contains(std::string_view line) const;
        std::size_t count(std::string_view line) const;

        // Adds line if missing and drops any duplicates after the first
        bool ensure_singleton(std::string_view line);
        bool remove_line(std::string_view line);
        bool remove_if(const std::function<bool(const ConfigLine&)>& predicate);

        bool has_block(std::string_view marker) const;
        std::vector<std::string> block(std::string_view marker) const;
        // Replaces every block with this marker by one block at end of file
        bool upsert_block(std::string_view marker, const std::vector<std::string>& body);
        bool remove_block(std::string_view marker);

        void append(std::string_view line);
        // Appends a blank separator first unless the document is empty or already ends blank
        void append_separated(const std::vector<std::string>& lines);
        void insert(std::size_t position, std::string_view line);

        // Index one past the marker's block, or npos without such block
        std::size_t block_end(std::string_view marker) const;

        static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    private:
        std::size_t find_marker(std::string_view marker, std::size_t from = 0) const;
        std::size_t end_of_block(std::size_t marker_index) const;
        // True when the last line is a comment or sits in a comment's directive run
        bool ends_in_block() const;

        std::vector<ConfigLine> lines_;
    };
}

#endif //PINET_DHCP_CONFIG_DOCUMENT_HPP
