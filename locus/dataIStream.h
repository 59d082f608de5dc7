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

#ifndef LOCUS_DATAISTREAM_H
#define LOCUS_DATAISTREAM_H

#include <locus/api.h>
#include <locus/types.h>

#include <lunchbox/array.h> // used inline

#include <boost/noncopyable.hpp>
#include <boost/static_assert.hpp>
#include <boost/type_traits.hpp>
#include <map>
#include <set>
#include <vector>

namespace locus
{
namespace detail { class DataIStream; }

/**
 * A std::istream-like input data stream for binary data.
 *
 * Reads from a contiguous memory region which has to stay valid during the
 * lifetime of the stream. Reading past the end of the data throws an
 * Exception of type DESERIALIZATION.
 */
class DataIStream : public boost::noncopyable
{
public:
    /** Construct a stream reading the given memory. @version 1.0 */
    LOCUS_API DataIStream( const void* data, const uint64_t size );

    /** Construct a stream reading the given snapshot. @version 1.0 */
    LOCUS_API explicit DataIStream( const Snapshot& snapshot );

    LOCUS_API virtual ~DataIStream();

    /** @name Data input */
    //@{
    /** @return a value from the stream. @version 1.0 */
    template< typename T > T read()
    {
        T value;
        *this >> value;
        return value;
    }

    /** Read a plain data item. @version 1.0 */
    template< class T > DataIStream& operator >> ( T& value )
    {
        _read( value, boost::has_trivial_copy< T >( ));
        return *this;
    }

    /** Read a C array. @version 1.0 */
    template< class T > DataIStream& operator >> ( lunchbox::Array< T > array )
    {
        _readArray( array, boost::has_trivial_copy< T >( ));
        return *this;
    }

    /** Read a std::vector of serializable items. @version 1.0 */
    template< class T > DataIStream& operator >> ( std::vector< T >& );

    /** Read a std::map of serializable items. @version 1.0 */
    template< class K, class V >
    DataIStream& operator >> ( std::map< K, V >& );

    /** Read a std::set of serializable items. @version 1.0 */
    template< class T > DataIStream& operator >> ( std::set< T >& );

    /**
     * Get the pointer to the remaining data and advance by the given size.
     *
     * @return the data, or 0 if less than size bytes are left.
     * @version 1.0
     */
    LOCUS_API const void* getRemainingBuffer( const uint64_t size );

    /** @return the size of the remaining data. @version 1.0 */
    LOCUS_API uint64_t getRemainingBufferSize() const;

    /** @return true if not all data has been read. @version 1.0 */
    bool hasData() const { return getRemainingBufferSize() > 0; }
    //@}

protected:
    /** @internal Construct a stream without input. */
    LOCUS_API DataIStream();

    /** @internal Set the input data and rewind. */
    LOCUS_API void _setInput( const void* data, const uint64_t size );

private:
    detail::DataIStream* const _impl;

    /** Read a number of bytes from the stream into a buffer. */
    LOCUS_API void _read( void* data, uint64_t size );

    /** @internal Throw if less than nElems of the given size are left. */
    LOCUS_API void _checkElements( const uint64_t nElems,
                                   const uint64_t elemSize ) const;

    /** Read an element count and reserve room for it. */
    template< class T >
    void _readSize( std::vector< T >& value, const uint64_t elemSize )
    {
        uint64_t nElems = 0;
        *this >> nElems;
        _checkElements( nElems, elemSize );
        value.resize( size_t( nElems ));
    }

    template< class T >
    void _readVector( std::vector< T >& value, const boost::true_type& )
    {
        _readSize( value, sizeof( T ));
        if( !value.empty( ))
            _read( &value.front(), value.size() * sizeof( T ));
    }

    template< class T >
    void _readVector( std::vector< T >& value, const boost::false_type& )
    {
        _readSize( value, 1 );
        for( size_t i = 0; i < value.size(); ++i )
            *this >> value[i];
    }

    /** Read a plain data item. */
    template< class T >
    void _read( T& value, const boost::true_type& )
    { _read( &value, sizeof( value )); }

    /** Non-trivial items need a specialization of operator >>. */
    template< class T >
    void _read( T&, const boost::false_type& )
    {
        BOOST_STATIC_ASSERT_MSG( sizeof( T ) == 0,
                                 "No deserialization for this type" );
    }

    /** Read an Array of POD data */
    template< class T >
    void _readArray( lunchbox::Array< T > array, const boost::true_type& )
    { _read( array.data, array.getNumBytes( )); }

    /** Read an Array of non-POD data */
    template< class T >
    void _readArray( lunchbox::Array< T > array, const boost::false_type& )
    {
        for( size_t i = 0; i < array.num; ++i )
            *this >> array.data[ i ];
    }
};
}

#include "dataIStream.ipp" // template implementation

#endif // LOCUS_DATAISTREAM_H
