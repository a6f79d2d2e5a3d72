#ifndef PINET_DHCP_RESERVATION_HPP
#define PINET_DHCP_RESERVATION_HPP

#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    class ConfigDocument;
    class DhcpService;
    class SharedConfigStore;

    /**
     * @brief One "dhcp-host=<mac>[,<hostname>],<ip>" line
     */
    struct DhcpReservation
    {
        std::string mac;
        std::string ip;
        std::string hostname;

        std::string to_line() const;

        // Validates and normalizes (lowercase MAC)
        static tl::expected<DhcpReservation, Error> make(std::string_view mac, std::string_view ip,
                                                         std::string_view hostname = {});
        // Exactly two or three comma-separated fields, anything else is malformed
        static tl::expected<DhcpReservation, Error> parse(std::string_view line);
    };

    /**
     * @brief MAC-keyed reservations kept under the "# DHCP Reservations" section
     */
    class ReservationManager
    {
    public:
        ReservationManager(const SharedConfigStore& store, const DhcpService& dhcp);

        tl::expected<Outcome, Error> add(std::string_view mac, std::string_view ip,
                                         std::string_view hostname = {}) const;
        tl::expected<Outcome, Error> remove(std::string_view mac) const;
        tl::expected<std::vector<DhcpReservation>, Error> list() const;

    private:
        const SharedConfigStore& store_;
        const DhcpService& dhcp_;
        mutable xtr::sink s_;
    };

    // Replaces every reservation line for the MAC with this one
    void upsert_reservation(ConfigDocument& document, const DhcpReservation& reservation);
    bool remove_reservation(ConfigDocument& document, std::string_view mac);
}

#endif //PINET_DHCP_RESERVATION_HPP
