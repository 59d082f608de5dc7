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

#ifndef LOCUS_NODEADDRESS_H
#define LOCUS_NODEADDRESS_H

#include <locus/api.h>
#include <locus/types.h>

#include <iostream>
#include <string>

namespace locus
{
/**
 * The network address of a kernel server or directory.
 *
 * Used as the location value of the directory and as the addressing unit of
 * outbound calls.
 */
struct NodeAddress
{
    NodeAddress() : port( 0 ) {}
    NodeAddress( const std::string& hostname_, const uint16_t port_ )
        : hostname( hostname_ ), port( port_ ) {}

    /**
     * Parse the address from its string representation.
     *
     * The format is <code>hostname[:port]</code>. A missing port is replaced
     * by Global::getDefaultPort().
     *
     * @return true if the string was parsed completely.
     * @version 1.0
     */
    LOCUS_API bool fromString( const std::string& data );

    /** @return the <code>hostname:port</code> form. @version 1.0 */
    LOCUS_API std::string toString() const;

    /** @return true if hostname and port are set. @version 1.0 */
    bool isValid() const { return !hostname.empty() && port != 0; }

    bool operator == ( const NodeAddress& rhs ) const
        { return port == rhs.port && hostname == rhs.hostname; }
    bool operator != ( const NodeAddress& rhs ) const
        { return !( *this == rhs ); }
    bool operator < ( const NodeAddress& rhs ) const
    {
        if( hostname == rhs.hostname )
            return port < rhs.port;
        return hostname < rhs.hostname;
    }

    std::string hostname; //!< host name or IP address
    uint16_t port;        //!< TCP port
};

inline std::ostream& operator << ( std::ostream& os, const NodeAddress& addr )
{
    return os << addr.toString();
}
}

#endif // LOCUS_NODEADDRESS_H
