/* Copyright (c) 2026, The Locus Authors
 *
 * This file is part of Locus
 *
 * This library is free software; you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License version 2.1 as published
 * by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#ifndef LOCUS_GLOBAL_H
#define LOCUS_GLOBAL_H

#include <locus/api.h>
#include <locus/types.h>

namespace locus
{
/** Global parameter handling for the Locus library. */
class Global
{
public:
    /** Global integer attributes. */
    enum IAttribute
    {
        /** Send and receive timeout of connections in milliseconds. */
        IATTR_TIMEOUT_DEFAULT,
        /** Attempts of a directory location update during migration. */
        IATTR_DIRECTORY_RETRIES,
        /** Delay between directory update attempts in milliseconds. */
        IATTR_DIRECTORY_RETRY_DELAY,
        /** Additional transfer attempts if the destination is unreachable. */
        IATTR_TRANSFER_RETRIES,
        /** Delay between transfer attempts in milliseconds. */
        IATTR_TRANSFER_RETRY_DELAY,
        /** Attempts of a location-transparent invocation. */
        IATTR_INVOKE_RETRIES,
        /** Backoff in milliseconds after an invalid state reply. */
        IATTR_INVOKE_BACKOFF,
        IATTR_ALL
    };

    /**
     * Set the default listening port.
     *
     * Used when a node address without port is parsed.
     */
    static LOCUS_API void setDefaultPort( const uint16_t port );

    /** @return the default listening port. */
    static LOCUS_API uint16_t getDefaultPort();

    /** Set an integer attribute. */
    static LOCUS_API void setIAttribute( const IAttribute attr,
                                         const int32_t value );

    /** @return the value of an integer attribute. */
    static LOCUS_API int32_t getIAttribute( const IAttribute attr );

    /** @return the connection timeout in milliseconds. */
    static LOCUS_API uint32_t getTimeout();

    /** @internal Initialize all attributes from a serialized string. */
    static LOCUS_API bool fromString( const std::string& data );

    /** @internal Serialize all attributes into a string. */
    static LOCUS_API void toString( std::string& data );
};
}

#endif // LOCUS_GLOBAL_H
