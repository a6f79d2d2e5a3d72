#ifndef PINET_LOGGER_HPP
#define PINET_LOGGER_HPP

#include <xtr/logger.hpp>

namespace PiNet
{
    /**
     * @brief Process-wide xtr logger; every component takes its own named sink from it
     */
    inline xtr::logger& logger()
    {
        static xtr::logger instance;
        return instance;
    }
}

#endif //PINET_LOGGER_HPP
