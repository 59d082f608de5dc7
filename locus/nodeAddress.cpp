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

#include "nodeAddress.h"

#include "global.h"

#include <lunchbox/log.h>

#include <boost/lexical_cast.hpp>
#include <sstream>

namespace locus
{
bool NodeAddress::fromString( const std::string& data )
{
    if( data.empty( ))
        return false;

    const size_t colon = data.rfind( ':' );
    if( colon == std::string::npos )
    {
        hostname = data;
        port = Global::getDefaultPort();
        return true;
    }

    const std::string host = data.substr( 0, colon );
    const std::string portString = data.substr( colon + 1 );
    if( host.empty() || portString.empty( ))
        return false;

    try
    {
        const uint32_t value = boost::lexical_cast< uint32_t >( portString );
        if( value == 0 || value > 0xffffu )
            return false;
        hostname = host;
        port = uint16_t( value );
    }
    catch( const boost::bad_lexical_cast& )
    {
        LBVERB << "Invalid port in node address " << data << std::endl;
        return false;
    }
    return true;
}

std::string NodeAddress::toString() const
{
    std::ostringstream os;
    os << hostname << ':' << port;
    return os.str();
}

}
