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

#ifndef LOCUS_OCOMMAND_H
#define LOCUS_OCOMMAND_H

#include <locus/commands.h>       // used inline
#include <locus/dataOStream.h>    // base class

namespace locus
{
/**
 * A class for sending commands with data.
 *
 * The header is written during construction, the payload is added using the
 * DataOStream operators, and send() transmits the complete command:
 * <code>uint64 size | uint32 command | payload</code>
 *
 * Example: @include tests/dataStream.cpp
 */
class OCommand : public DataOStream
{
public:
    /** Construct a new command for the given command id. @version 1.0 */
    LOCUS_API explicit OCommand( const uint32_t cmd );

    LOCUS_API virtual ~OCommand();

    /** @return the command id. @version 1.0 */
    uint32_t getCommand() const { return _command; }

    /**
     * Send the command using the given connection.
     *
     * Updates the size field in the header. The command may be sent more than
     * once, e.g., after a reconnect.
     *
     * @return true if the command was sent completely.
     * @version 1.0
     */
    LOCUS_API bool send( ConnectionPtr connection );

    /** Discard the payload, retaining the header. @version 1.0 */
    LOCUS_API void reset() override;

    /** @return the static size of the command header. @version 1.0 */
    LOCUS_API static size_t getSize();

private:
    const uint32_t _command;

    void _init();
};
}

#endif //LOCUS_OCOMMAND_H
