#include "PiNet/Dhcp/ConfigDocument.hpp"
#include "PiNet/Util/Strings.hpp"

#include <algorithm>

using std::string, std::string_view, std::vector;

namespace PiNet
{
    ConfigLine ConfigLine::parse(const string_view text)
    {
        ConfigLine line;
        line.raw = string(text);
        const auto trimmed = Util::trim(text);
        if (trimmed.empty())
        {
            line.kind = Kind::Blank;
        }
        else if (trimmed.front() == '#')
        {
            line.kind = Kind::Comment;
        }
        else
        {
            line.kind = Kind::Directive;
            const auto equals = trimmed.find('=');
            if (equals == string_view::npos)
            {
                line.key = string(trimmed);
            }
            else
            {
                line.key = string(Util::trim(trimmed.substr(0, equals)));
                line.value = string(Util::trim(trimmed.substr(equals + 1)));
                line.has_value = true;
            }
        }
        return line;
    }

    bool ConfigLine::equals(const string_view line) const
    {
        return Util::trim(raw) == Util::trim(line);
    }

    ConfigDocument ConfigDocument::parse(const string_view text)
    {
        ConfigDocument document;
        for (const auto& line : Util::lines(text))
        {
            document.lines_.push_back(ConfigLine::parse(line));
        }
        return document;
    }

    string ConfigDocument::serialize() const
    {
        string text;
        for (const auto& line : lines_)
        {
            text += line.raw;
            text += '\n';
        }
        return text;
    }

    bool ConfigDocument::contains(const string_view line) const
    {
        return count(line) > 0;
    }

    std::size_t ConfigDocument::count(const string_view line) const
    {
        std::size_t n = 0;
        for (const auto& entry : lines_)
        {
            if (entry.equals(line))
            {
                ++n;
            }
        }
        return n;
    }

    bool ConfigDocument::ensure_singleton(const string_view line)
    {
        bool seen = false;
        bool changed = false;
        for (auto it = lines_.begin(); it != lines_.end();)
        {
            if (it->equals(line))
            {
                if (seen)
                {
                    it = lines_.erase(it);
                    changed = true;
                    continue;
                }
                seen = true;
            }
            ++it;
        }
        if (!seen)
        {
            // A global directive must not become part of a trailing block
            if (ends_in_block())
            {
                append_separated({string(Util::trim(line))});
            }
            else
            {
                append(Util::trim(line));
            }
            changed = true;
        }
        return changed;
    }

    bool ConfigDocument::ends_in_block() const
    {
        for (auto it = lines_.rbegin(); it != lines_.rend(); ++it)
        {
            if (it->kind != ConfigLine::Kind::Directive)
            {
                return it->kind == ConfigLine::Kind::Comment;
            }
        }
        return false;
    }

    bool ConfigDocument::remove_line(const string_view line)
    {
        return remove_if([line](const ConfigLine& entry) { return entry.equals(line); });
    }

    bool ConfigDocument::remove_if(const std::function<bool(const ConfigLine&)>& predicate)
    {
        const auto before = lines_.size();
        std::erase_if(lines_, predicate);
        return lines_.size() != before;
    }

    std::size_t ConfigDocument::find_marker(const string_view marker, const std::size_t from) const
    {
        for (std::size_t i = from; i < lines_.size(); ++i)
        {
            if (lines_[i].kind == ConfigLine::Kind::Comment && lines_[i].equals(marker))
            {
                return i;
            }
        }
        return npos;
    }

    std::size_t ConfigDocument::end_of_block(const std::size_t marker_index) const
    {
        std::size_t end = marker_index + 1;
        while (end < lines_.size() && lines_[end].kind == ConfigLine::Kind::Directive)
        {
            ++end;
        }
        return end;
    }

    bool ConfigDocument::has_block(const string_view marker) const
    {
        return find_marker(marker) != npos;
    }

    vector<string> ConfigDocument::block(const string_view marker) const
    {
        vector<string> body;
        const auto start = find_marker(marker);
        if (start == npos)
        {
            return body;
        }
        const auto end = end_of_block(start);
        for (std::size_t i = start + 1; i < end; ++i)
        {
            body.emplace_back(Util::trim(lines_[i].raw));
        }
        return body;
    }

    std::size_t ConfigDocument::block_end(const string_view marker) const
    {
        const auto start = find_marker(marker);
        return start == npos ? npos : end_of_block(start);
    }

    bool ConfigDocument::remove_block(const string_view marker)
    {
        bool changed = false;
        for (auto start = find_marker(marker); start != npos; start = find_marker(marker, start))
        {
            const auto end = end_of_block(start);
            lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(start),
                         lines_.begin() + static_cast<std::ptrdiff_t>(end));
            changed = true;

            // Collapse the separator the block leaves behind
            const bool blank_before = start == 0 || lines_[start - 1].kind == ConfigLine::Kind::Blank;
            if (start < lines_.size() && blank_before && lines_[start].kind == ConfigLine::Kind::Blank)
            {
                lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(start));
            }
            else if (start == lines_.size() && start > 0 && lines_[start - 1].kind == ConfigLine::Kind::Blank)
            {
                lines_.pop_back();
                --start;
            }
        }
        return changed;
    }

    bool ConfigDocument::upsert_block(const string_view marker, const vector<string>& body)
    {
        const auto before = serialize();
        remove_block(marker);

        vector<string> block_lines;
        block_lines.emplace_back(Util::trim(marker));
        block_lines.insert(block_lines.end(), body.begin(), body.end());
        append_separated(block_lines);

        return serialize() != before;
    }

    void ConfigDocument::append(const string_view line)
    {
        lines_.push_back(ConfigLine::parse(line));
    }

    void ConfigDocument::append_separated(const vector<string>& lines)
    {
        if (!lines_.empty() && lines_.back().kind != ConfigLine::Kind::Blank)
        {
            append("");
        }
        for (const auto& line : lines)
        {
            append(line);
        }
    }

    void ConfigDocument::insert(const std::size_t position, const string_view line)
    {
        const auto at = std::min(position, lines_.size());
        lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(at), ConfigLine::parse(line));
    }
}
