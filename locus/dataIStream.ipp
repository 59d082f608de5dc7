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
template<> inline DataIStream& DataIStream::operator >> ( std::string& str )
{
    const uint64_t nChars = read< uint64_t >();
    _checkElements( nChars, 1 );
    if( nChars == 0 )
        str.clear();
    else
        str.assign( static_cast< const char* >( getRemainingBuffer( nChars )),
                    size_t( nChars ));
    return *this;
}

template<> inline DataIStream& DataIStream::operator >> ( uint128_t& id )
{
    const uint64_t high = read< uint64_t >();
    const uint64_t low = read< uint64_t >();
    id = uint128_t( high, low );
    return *this;
}

template<> inline DataIStream& DataIStream::operator >> ( NodeAddress& addr )
{
    return (*this) >> addr.hostname >> addr.port;
}

/** @cond IGNORE */
template< class T > inline DataIStream&
DataIStream::operator >> ( std::vector< T >& value )
{
    _readVector( value, boost::is_pod< T >( ));
    return *this;
}

// Map and set elements are at least one byte each
template< class K, class V > inline DataIStream&
DataIStream::operator >> ( std::map< K, V >& map )
{
    map.clear();
    const uint64_t nElems = read< uint64_t >();
    _checkElements( nElems, 1 );
    for( uint64_t i = 0; i < nElems; ++i )
    {
        const K key = read< K >();
        map[ key ] = read< V >();
    }
    return *this;
}

template< class T > inline DataIStream&
DataIStream::operator >> ( std::set< T >& value )
{
    value.clear();
    const uint64_t nElems = read< uint64_t >();
    _checkElements( nElems, 1 );
    for( uint64_t i = 0; i < nElems; ++i )
        value.insert( read< T >( ));
    return *this;
}
/** @endcond */
}
