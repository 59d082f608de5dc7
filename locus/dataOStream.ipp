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

#include <locus/nodeAddress.h>

namespace locus
{
// Strings and identifiers appear in every snapshot and command
template<>
inline DataOStream& DataOStream::operator << ( const std::string& str )
{
    const uint64_t nChars = str.length();
    _write( &nChars, sizeof( nChars ));
    if( nChars > 0 )
        _write( str.data(), nChars );
    return *this;
}

template<>
inline DataOStream& DataOStream::operator << ( const uint128_t& id )
{
    return (*this) << id.high() << id.low();
}

template<>
inline DataOStream& DataOStream::operator << ( const NodeAddress& addr )
{
    return (*this) << addr.hostname << addr.port;
}

/** @cond IGNORE */
template< class T > inline DataOStream&
DataOStream::operator << ( const std::vector< T >& value )
{
    _writeVector( value, boost::is_pod< T >( ));
    return *this;
}

template< class K, class V > inline DataOStream&
DataOStream::operator << ( const std::map< K, V >& value )
{
    *this << uint64_t( value.size( ));
    for( typename std::map< K, V >::const_iterator i = value.begin();
         i != value.end(); ++i )
    {
        *this << i->first << i->second;
    }
    return *this;
}

template< class T > inline DataOStream&
DataOStream::operator << ( const std::set< T >& value )
{
    *this << uint64_t( value.size( ));
    for( typename std::set< T >::const_iterator i = value.begin();
         i != value.end(); ++i )
    {
        *this << *i;
    }
    return *this;
}
/** @endcond */
}
