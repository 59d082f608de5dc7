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

#include "dataOStream.h"

#include <lunchbox/debug.h>

#include <string.h>

namespace locus
{
namespace detail
{
class DataOStream
{
public:
    /** The buffer used for saving and buffering */
    lunchbox::Bufferb buffer;
};
}

DataOStream::DataOStream()
    : _impl( new detail::DataOStream )
{}

DataOStream::~DataOStream()
{
    delete _impl;
}

void DataOStream::_write( const void* data, uint64_t size )
{
    if( size == 0 )
        return;
    _impl->buffer.append( static_cast< const uint8_t* >( data ), size );
}

void DataOStream::_overwrite( const uint64_t position, const void* data,
                              const uint64_t size )
{
    LBASSERT( position + size <= _impl->buffer.getSize( ));
    ::memcpy( _impl->buffer.getData() + position, data, size );
}

const uint8_t* DataOStream::getData() const
{
    return _impl->buffer.getData();
}

uint64_t DataOStream::getSize() const
{
    return _impl->buffer.getSize();
}

Snapshot DataOStream::toSnapshot() const
{
    const uint8_t* data = _impl->buffer.getData();
    return Snapshot( data, data + _impl->buffer.getSize( ));
}

void DataOStream::reset()
{
    _impl->buffer.setSize( 0 );
}

lunchbox::Bufferb& DataOStream::getBuffer()
{
    return _impl->buffer;
}

}
