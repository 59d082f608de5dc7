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

#ifndef LOCUS_DATAOSTREAM_H
#define LOCUS_DATAOSTREAM_H

#include <locus/api.h>
#include <locus/types.h>

#include <lunchbox/array.h> // used inline
#include <lunchbox/buffer.h> // used inline

#include <boost/noncopyable.hpp>
#include <boost/static_assert.hpp>
#include <boost/type_traits.hpp>
#include <map>
#include <set>
#include <vector>

namespace locus
{
namespace detail { class DataOStream; }

/**
 * A std::ostream-like interface for object serialization.
 *
 * Retains all written data in a binary format in an internal buffer. The
 * buffer is sent by OCommand or copied into an object Snapshot.
 */
class DataOStream : public boost::noncopyable
{
public:
    /** Construct a new, empty output stream. @version 1.0 */
    LOCUS_API DataOStream();

    /** Destruct this output stream. @version 1.0 */
    virtual LOCUS_API ~DataOStream();

    /** @name Data output */
    //@{
    /** Write a plain data item by copying it to the stream. @version 1.0 */
    template< class T > DataOStream& operator << ( const T& value )
    { _write( value, boost::has_trivial_copy< T >( )); return *this; }

    /** Write a C array. @version 1.0 */
    template< class T >
    DataOStream& operator << ( const lunchbox::Array< T > array )
    { _writeArray( array, boost::is_pod< T >( )); return *this; }

    /** Write a std::vector of serializable items. @version 1.0 */
    template< class T >
    DataOStream& operator << ( const std::vector< T >& value );

    /** Write a std::map of serializable items. @version 1.0 */
    template< class K, class V >
    DataOStream& operator << ( const std::map< K, V >& value );

    /** Write a std::set of serializable items. @version 1.0 */
    template< class T >
    DataOStream& operator << ( const std::set< T >& value );
    //@}

    /** @name Data access */
    //@{
    /** @return the data written so far. @version 1.0 */
    LOCUS_API const uint8_t* getData() const;

    /** @return the number of bytes written so far. @version 1.0 */
    LOCUS_API uint64_t getSize() const;

    /** @return a copy of the written data. @version 1.0 */
    LOCUS_API Snapshot toSnapshot() const;

    /** Discard all written data. @version 1.0 */
    virtual LOCUS_API void reset();
    //@}

protected:
    /** @internal */
    LOCUS_API lunchbox::Bufferb& getBuffer();

    /** @internal Overwrite already written data at the given position. */
    LOCUS_API void _overwrite( const uint64_t position, const void* data,
                               const uint64_t size );

private:
    detail::DataOStream* const _impl;

    /** Write a number of bytes from data into the stream. */
    LOCUS_API void _write( const void* data, uint64_t size );

    /** Write a trivially copyable item. */
    template< class T >
    void _write( const T& value, const boost::true_type& )
    { _write( &value, sizeof( value )); }

    /** Non-trivial items need a specialization of operator <<. */
    template< class T >
    void _write( const T&, const boost::false_type& )
    {
        BOOST_STATIC_ASSERT_MSG( sizeof( T ) == 0,
                                 "No serialization for this type" );
    }

    template< class T >
    void _writeVector( const std::vector< T >& value, const boost::true_type& )
    {
        const uint64_t nElems = value.size();
        _write( &nElems, sizeof( nElems ));
        if( nElems > 0 )
            _write( &value.front(), nElems * sizeof( T ));
    }

    template< class T >
    void _writeVector( const std::vector< T >& value,
                       const boost::false_type& )
    {
        *this << uint64_t( value.size( ));
        for( size_t i = 0; i < value.size(); ++i )
            *this << value[i];
    }

    /** Write an Array of POD data */
    template< class T >
    void _writeArray( const lunchbox::Array< T > array,
                      const boost::true_type& )
    { _write( array.data, array.getNumBytes( )); }

    /** Write an Array of non-POD data */
    template< class T >
    void _writeArray( const lunchbox::Array< T > array,
                      const boost::false_type& )
    {
        for( size_t i = 0; i < array.num; ++i )
            *this << array.data[ i ];
    }
};
}

#include "dataOStream.ipp" // template implementation

#endif //LOCUS_DATAOSTREAM_H
