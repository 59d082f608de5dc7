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

#include "dataIStream.h"

#include "exception.h"
#include "log.h"

#include <sstream>
#include <string.h>

namespace locus
{
namespace detail
{
class DataIStream
{
public:
    DataIStream()
        : input( 0 )
        , inputSize( 0 )
        , position( 0 )
    {}

    /** The current input buffer */
    const uint8_t* input;

    /** The size of the input buffer */
    uint64_t inputSize;

    /** The current read position in the buffer */
    uint64_t position;
};
}

DataIStream::DataIStream()
        : _impl( new detail::DataIStream )
{}

DataIStream::DataIStream( const void* data, const uint64_t size )
        : _impl( new detail::DataIStream )
{
    _setInput( data, size );
}

DataIStream::DataIStream( const Snapshot& snapshot )
        : _impl( new detail::DataIStream )
{
    if( !snapshot.empty( ))
        _setInput( &snapshot.front(), snapshot.size( ));
}

DataIStream::~DataIStream()
{
    delete _impl;
}

void DataIStream::_setInput( const void* data, const uint64_t size )
{
    _impl->input = static_cast< const uint8_t* >( data );
    _impl->inputSize = data ? size : 0;
    _impl->position = 0;
}

void DataIStream::_read( void* data, uint64_t size )
{
    if( size == 0 )
        return;

    if( size > _impl->inputSize - _impl->position )
    {
        std::ostringstream os;
        os << "Not enough data in input buffer: need " << size << " bytes, "
           << _impl->inputSize - _impl->position << " left";
        LBLOG( LOG_OBJECTS ) << os.str() << std::endl;
        throw Exception( Exception::DESERIALIZATION, os.str( ));
    }

    ::memcpy( data, _impl->input + _impl->position, size );
    _impl->position += size;
}

void DataIStream::_checkElements( const uint64_t nElems,
                                  const uint64_t elemSize ) const
{
    const uint64_t left = _impl->inputSize - _impl->position;
    if( nElems > left / elemSize )
    {
        std::ostringstream os;
        os << "Out-of-sync input stream: " << nElems << " elements of "
           << elemSize << " bytes with " << left << " bytes left";
        throw Exception( Exception::DESERIALIZATION, os.str( ));
    }
}

const void* DataIStream::getRemainingBuffer( const uint64_t size )
{
    if( _impl->position + size > _impl->inputSize )
        return 0;

    _impl->position += size;
    return _impl->input + _impl->position - size;
}

uint64_t DataIStream::getRemainingBufferSize() const
{
    return _impl->inputSize - _impl->position;
}

}
