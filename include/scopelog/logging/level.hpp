#ifndef SCOPELOG_LOGGING_LEVEL_HPP
#define SCOPELOG_LOGGING_LEVEL_HPP

#include <cstdint>
#include <string>

namespace scopelog {

    namespace logging {

        /*!  @file      level.hpp
         *   @brief     Severity flags shared by the validation logger and the diagnostic logger.
         *   @details   Every flag is a separate bit, so an arbitrary subset of levels can be
         *              enabled (e.g. LOG_MASK_WARNING|LOG_MASK_ERROR). Masks are passed around as uint8_t.
         */
        enum LogMask {
            LOG_MASK_NONE    = 0,
            LOG_MASK_TRACE   = 1,       //!< verbose tracing of the validation process
            LOG_MASK_DEBUG   = 2,       //!< debugging of the validator itself
            LOG_MASK_INFO    = 4,       //!< information about the item, unrelated to its validity
            LOG_MASK_WARNING = 8,       //!< tolerable problem, or one that was corrected unambiguously
            LOG_MASK_ERROR   = 16,      //!< the item failed validation
            LOG_MASK_ALL     = 31
        };

        const uint8_t LOG_MASK_DEFAULT = LOG_MASK_INFO | LOG_MASK_WARNING | LOG_MASK_ERROR;
        const int LOG_VERBOSITY_MAX = 5;

        /*! @brief True if exactly one of the five severity bits is set (and nothing else).
         */
        inline bool isSingleLevel( int m ) {
            return ( m > 0 ) && !( m & ~LOG_MASK_ALL ) && !( m & ( m - 1 ) );
        }

        /*! @brief Mask with the \c n most severe levels enabled. 0 gives LOG_MASK_NONE, 1 gives
         *         LOG_MASK_ERROR, and so on up to LOG_VERBOSITY_MAX (LOG_MASK_ALL).
         */
        inline uint8_t maskFromVerbosity( int n ) {
            if( n <= 0 ) return LOG_MASK_NONE;
            if( n >= LOG_VERBOSITY_MAX ) return LOG_MASK_ALL;
            return LOG_MASK_ALL & ~( ( LOG_MASK_ERROR >> ( n - 1 ) ) - 1 );
        }

        int verbosityFromMask( uint8_t m );

        /*! @fn const char* levelName( uint8_t m )
         *  @brief Name of a single level ("Trace", "Debug", "Information", "Warning" or "Error").
         *  @returns nullptr if \c m is not a single level.
         */
        const char* levelName( uint8_t m );

        /*! @fn std::string maskToString( uint8_t m )
         *  @brief Readable form of a mask: "None", "All", a single name, or names joined with '|'.
         */
        std::string maskToString( uint8_t m );

        /*! @fn uint8_t stringToMask( const std::string& s )
         *  @brief Parse a list of level names separated by '|', ',', '+' or whitespace.
         *  @details Case-insensitive, accepts "None", "All" and "Info" as an alias for "Information".
         *  @throws BadArgument on unrecognized tokens.
         */
        uint8_t stringToMask( const std::string& s );

    }   // logging

}   // scopelog


#endif  // SCOPELOG_LOGGING_LEVEL_HPP
