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

#ifndef LOCUS_DISPATCHER_H
#define LOCUS_DISPATCHER_H

#include <locus/api.h>
#include <locus/types.h>

#include <boost/function.hpp>

namespace locus
{
namespace detail { class Dispatcher; }

/**
 * A helper class providing command handler functions for command ids.
 *
 * A handler reads the request from the ICommand and writes the payload of the
 * reply into the OCommand. Failures are reported by throwing an Exception.
 */
class Dispatcher
{
public:
    /** The signature of a command handler. @version 1.0 */
    typedef boost::function< void( ICommand&, OCommand& ) > CommandHandler;

    /**
     * Register a command handler.
     *
     * Registering a handler for an already registered command replaces the
     * previous handler.
     *
     * @param command the command id.
     * @param handler the handler to call for this command.
     * @version 1.0
     */
    LOCUS_API void registerCommand( const uint32_t command,
                                    const CommandHandler& handler );

    /**
     * Dispatch a command to the registered handler.
     *
     * @param command the received command.
     * @param reply the reply to complete.
     * @return true if a handler was found, false otherwise.
     * @version 1.0
     */
    LOCUS_API virtual bool dispatchCommand( ICommand& command,
                                            OCommand& reply );

protected:
    LOCUS_API Dispatcher();
    LOCUS_API virtual ~Dispatcher();

    /** The default handler for unknown commands. */
    LOCUS_API bool _cmdUnknown( ICommand& command );

private:
    Dispatcher( const Dispatcher& );
    Dispatcher& operator = ( const Dispatcher& );
    detail::Dispatcher* const _impl;
};
}
#endif // LOCUS_DISPATCHER_H
