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

#ifndef LOCUS_BUFFER_H
#define LOCUS_BUFFER_H

#include <locus/api.h>
#include <locus/types.h>

#include <lunchbox/buffer.h>        // base class
#include <lunchbox/referenced.h>    // base class

namespace locus
{
/**
 * A reference-counted buffer holding one received command.
 *
 * The buffer is shared between the receiving connection thread and the
 * ICommand reading from it.
 */
class Buffer : public lunchbox::Bufferb, public lunchbox::Referenced
{
public:
    /** Construct a new buffer. @version 1.0 */
    Buffer() {}

    /** Destruct this buffer. @version 1.0 */
    virtual ~Buffer() {}
};

inline std::ostream& operator << ( std::ostream& os, const Buffer& buffer )
{
    return os << "buffer< size " << buffer.getSize() << " >";
}
}

#endif //LOCUS_BUFFER_H
