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

#ifndef LOCUS_ICOMMAND_H
#define LOCUS_ICOMMAND_H

#include <locus/commands.h>     // for enum Commands
#include <locus/dataIStream.h>  // base class

namespace locus
{
namespace detail { class ICommand; }

/**
 * A class managing received commands.
 *
 * This class is used by the Server and the Client to read the payload of a
 * received command. The header is consumed on construction.
 */
class ICommand : public DataIStream
{
public:
    /** @internal Construct a command from a received buffer. */
    LOCUS_API ICommand( ConnectionPtr connection, ConstBufferPtr buffer );

    LOCUS_API virtual ~ICommand(); //!< @internal

    /** @name Data Access */
    //@{
    /** @return the command. @version 1.0 */
    LOCUS_API uint32_t getCommand() const;

    /** @return the command size, including the header. @version 1.0 */
    LOCUS_API uint64_t getSize() const;

    /** @return the connection the command was received on. @version 1.0 */
    LOCUS_API ConnectionPtr getConnection() const;

    /** @return true if the command has a valid header. @version 1.0 */
    LOCUS_API bool isValid() const;
    //@}

    /**
     * Read one complete command from the given connection.
     *
     * @return the buffer holding the command, or 0 if the connection was
     *         closed, timed out or delivered a malformed header.
     * @version 1.0
     */
    LOCUS_API static BufferPtr readBuffer( ConnectionPtr connection );

private:
    detail::ICommand* const _impl;
};

LOCUS_API std::ostream& operator << ( std::ostream& os, const ICommand& );
}
#endif // LOCUS_ICOMMAND_H
