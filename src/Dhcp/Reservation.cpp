#include "PiNet/Dhcp/Reservation.hpp"
#include "PiNet/Dhcp/ConfigDocument.hpp"
#include "PiNet/Dhcp/DhcpService.hpp"
#include "PiNet/Dhcp/SharedConfigStore.hpp"
#include "PiNet/Util/Address.hpp"
#include "PiNet/Util/Logger.hpp"
#include "PiNet/Util/Strings.hpp"
#include "PiNet/Config.hpp"

#include <format>

using tl::unexpected, std::string, std::string_view, std::vector, std::format;

namespace
{
    bool is_reservation_for(const PiNet::ConfigLine& line, const string_view mac)
    {
        if (line.kind != PiNet::ConfigLine::Kind::Directive || line.key != PiNet::Config::RESERVATION_KEY)
        {
            return false;
        }
        const auto comma = line.value.find(',');
        return PiNet::Util::to_lower(PiNet::Util::trim(string_view(line.value).substr(0, comma))) == mac;
    }
}

namespace PiNet
{
    string DhcpReservation::to_line() const
    {
        if (hostname.empty())
        {
            return format("{}={},{}", Config::RESERVATION_KEY, mac, ip);
        }
        return format("{}={},{},{}", Config::RESERVATION_KEY, mac, hostname, ip);
    }

    tl::expected<DhcpReservation, Error> DhcpReservation::make(const string_view mac, const string_view ip,
                                                               const string_view hostname)
    {
        auto normalized = Util::normalize_mac(mac);
        if (!normalized)
        {
            return unexpected(normalized.error());
        }
        if (auto valid = Util::validate_ipv4(ip); !valid)
        {
            return unexpected(valid.error());
        }
        const auto name = Util::trim(hostname);
        if (!name.empty() && !Util::is_hostname(name))
        {
            return unexpected(Error{ErrorCode::InvalidHostname, format("Invalid hostname: '{}'", hostname)});
        }
        return DhcpReservation{std::move(*normalized), string(ip), string(name)};
    }

    tl::expected<DhcpReservation, Error> DhcpReservation::parse(const string_view line)
    {
        const auto parsed = ConfigLine::parse(line);
        if (parsed.kind != ConfigLine::Kind::Directive || parsed.key != Config::RESERVATION_KEY || !parsed.has_value)
        {
            return unexpected(Error{ErrorCode::MalformedReservation, format("Not a reservation: '{}'", line)});
        }

        auto fields = Util::split(parsed.value, ',');
        for (auto& field : fields)
        {
            field = string(Util::trim(field));
        }

        tl::expected<DhcpReservation, Error> reservation = unexpected(Error{
            ErrorCode::MalformedReservation,
            format("Expected <mac>[,<hostname>],<ip> but got {} fields: '{}'", fields.size(), line)
        });
        if (fields.size() == 2)
        {
            reservation = make(fields[0], fields[1]);
        }
        else if (fields.size() == 3)
        {
            reservation = make(fields[0], fields[2], fields[1]);
        }

        if (!reservation)
        {
            return unexpected(Error{ErrorCode::MalformedReservation, reservation.error().message});
        }
        return reservation;
    }

    void upsert_reservation(ConfigDocument& document, const DhcpReservation& reservation)
    {
        const string line = reservation.to_line();

        std::size_t matches = 0;
        bool current = false;
        for (const auto& entry : document.lines())
        {
            if (is_reservation_for(entry, reservation.mac))
            {
                ++matches;
                current = entry.equals(line);
            }
        }
        if (matches == 1 && current)
        {
            return;
        }

        remove_reservation(document, reservation.mac);
        auto end = document.block_end(Config::RESERVATION_SECTION_MARKER);
        if (end == ConfigDocument::npos)
        {
            end = document.block_end(Config::LEGACY_RESERVATION_SECTION_MARKER);
        }
        if (end != ConfigDocument::npos)
        {
            document.insert(end, line);
        }
        else
        {
            document.append_separated({Config::RESERVATION_SECTION_MARKER, line});
        }
    }

    bool remove_reservation(ConfigDocument& document, const string_view mac)
    {
        return document.remove_if([mac](const ConfigLine& entry) { return is_reservation_for(entry, mac); });
    }

    ReservationManager::ReservationManager(const SharedConfigStore& store, const DhcpService& dhcp)
        : store_(store), dhcp_(dhcp)
    {
        s_ = logger().get_sink("PiNet Reservations");
    }

    tl::expected<Outcome, Error> ReservationManager::add(const string_view mac, const string_view ip,
                                                         const string_view hostname) const
    {
        auto reservation = DhcpReservation::make(mac, ip, hostname);
        if (!reservation)
        {
            XTR_LOGL(warning, s_, "Rejected reservation: {}", reservation.error().message);
            return unexpected(reservation.error());
        }

        auto changed = store_.update([&](ConfigDocument& document) { upsert_reservation(document, *reservation); });
        if (!changed)
        {
            return unexpected(changed.error());
        }
        if (*changed)
        {
            XTR_LOGL(info, s_, "Reserved {} for {}", reservation->ip, reservation->mac);
        }
        return dhcp_.propagate(*changed);
    }

    tl::expected<Outcome, Error> ReservationManager::remove(const string_view mac) const
    {
        auto normalized = Util::normalize_mac(mac);
        if (!normalized)
        {
            return unexpected(normalized.error());
        }

        auto changed = store_.update([&](ConfigDocument& document) { remove_reservation(document, *normalized); });
        if (!changed)
        {
            return unexpected(changed.error());
        }
        if (*changed)
        {
            XTR_LOGL(info, s_, "Removed reservation for {}", *normalized);
        }
        else
        {
            XTR_LOGL(debug, s_, "No reservation for {}", *normalized);
        }
        return dhcp_.propagate(*changed);
    }

    tl::expected<vector<DhcpReservation>, Error> ReservationManager::list() const
    {
        auto document = store_.load();
        if (!document)
        {
            return unexpected(document.error());
        }

        vector<DhcpReservation> reservations;
        for (const auto& entry : document->lines())
        {
            if (entry.kind != ConfigLine::Kind::Directive || entry.key != Config::RESERVATION_KEY)
            {
                continue;
            }
            auto reservation = DhcpReservation::parse(entry.raw);
            if (!reservation)
            {
                XTR_LOGL(warning, s_, "Skipping malformed reservation: {}", reservation.error().message);
                continue;
            }
            reservations.push_back(std::move(*reservation));
        }
        return reservations;
    }
}
