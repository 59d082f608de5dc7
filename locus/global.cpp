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

#include "global.h"

#include <lunchbox/log.h>

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace locus
{
namespace
{
const std::string _marker( "##" );
const int32_t _defaultTimeout = 30000; // ms

int32_t _getTimeout()
{
    const char* env = ::getenv( "LOCUS_TIMEOUT" );
    if( !env )
        return _defaultTimeout;
    try
    {
        const int32_t timeout = boost::lexical_cast< int32_t >( env );
        return timeout > 0 ? timeout : _defaultTimeout;
    }
    catch( const boost::bad_lexical_cast& )
    {
        LBWARN << "Ignoring invalid LOCUS_TIMEOUT " << env << std::endl;
        return _defaultTimeout;
    }
}

uint16_t _defaultPort = 4242;
int32_t _iAttributes[ Global::IATTR_ALL ] =
{
    _getTimeout(), // TIMEOUT_DEFAULT
    5,             // DIRECTORY_RETRIES
    200,           // DIRECTORY_RETRY_DELAY
    2,             // TRANSFER_RETRIES
    100,           // TRANSFER_RETRY_DELAY
    8,             // INVOKE_RETRIES
    20,            // INVOKE_BACKOFF
};
}

bool Global::fromString( const std::string& data )
{
    // ##value#value#...#value##
    const size_t markers = 2 * _marker.size();
    if( data.size() <= markers || data.compare( 0, 2, _marker ) != 0 ||
        data.compare( data.size() - 2, 2, _marker ) != 0 )
    {
        return false;
    }

    std::vector< std::string > fields;
    const std::string values = data.substr( 2, data.size() - markers );
    for( size_t start = 0; start <= values.size(); )
    {
        size_t end = values.find( '#', start );
        if( end == std::string::npos )
            end = values.size();
        fields.push_back( values.substr( start, end - start ));
        start = end + 1;
    }
    if( fields.size() != IATTR_ALL )
    {
        LBWARN << "Expected " << unsigned( IATTR_ALL ) << " globals, got "
               << fields.size() << std::endl;
        return false;
    }

    int32_t newGlobals[ IATTR_ALL ];
    for( size_t i = 0; i < fields.size(); ++i )
    {
        try
        {
            newGlobals[ i ] = boost::lexical_cast< int32_t >( fields[ i ] );
        }
        catch( const boost::bad_lexical_cast& )
        {
            LBWARN << "Invalid global attribute '" << fields[ i ] << "'"
                   << std::endl;
            return false;
        }
    }

    std::copy( newGlobals, newGlobals + IATTR_ALL, _iAttributes );
    return true;
}

void Global::toString( std::string& data )
{
    std::ostringstream stream;
    stream << _marker;
    for( uint32_t i = 0; i < IATTR_ALL; ++i )
        stream << ( i == 0 ? "" : "#" ) << _iAttributes[ i ];
    stream << _marker;
    data = stream.str();
}
void Global::setDefaultPort( const uint16_t port )
{
    _defaultPort = port;
}

uint16_t Global::getDefaultPort()
{
    return _defaultPort;
}

void Global::setIAttribute( const IAttribute attr, const int32_t value )
{
    _iAttributes[ attr ] = value;
}

int32_t Global::getIAttribute( const IAttribute attr )
{
    return _iAttributes[ attr ];
}

uint32_t Global::getTimeout()
{
    const int32_t timeout = getIAttribute( IATTR_TIMEOUT_DEFAULT );
    return timeout > 0 ? uint32_t( timeout ) : LB_TIMEOUT_INDEFINITE;
}

}
