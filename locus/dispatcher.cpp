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

#include "dispatcher.h"

#include "iCommand.h"
#include "log.h"

#include <lunchbox/debug.h>
#include <lunchbox/lockable.h>
#include <lunchbox/scopedMutex.h>
#include <lunchbox/spinLock.h>
#include <lunchbox/stdExt.h>

namespace locus
{
namespace detail
{
class Dispatcher
{
public:
    typedef stde::hash_map< uint32_t,
                            locus::Dispatcher::CommandHandler > Handlers;

    /** The command handlers, indexed by command id. */
    lunchbox::Lockable< Handlers, lunchbox::SpinLock > handlers;
};
}

Dispatcher::Dispatcher()
    : _impl( new detail::Dispatcher )
{}

Dispatcher::~Dispatcher()
{
    delete _impl;
}

void Dispatcher::registerCommand( const uint32_t command,
                                  const CommandHandler& handler )
{
    lunchbox::ScopedFastWrite mutex( _impl->handlers );
    (*_impl->handlers)[ command ] = handler;
}

bool Dispatcher::dispatchCommand( ICommand& command, OCommand& reply )
{
    LBASSERT( command.isValid( ));

    CommandHandler handler;
    {
        lunchbox::ScopedFastRead mutex( _impl->handlers );
        detail::Dispatcher::Handlers::const_iterator i =
            _impl->handlers->find( command.getCommand( ));
        if( i == _impl->handlers->end( ))
            return _cmdUnknown( command );
        handler = i->second;
    }

    handler( command, reply );
    return true;
}

bool Dispatcher::_cmdUnknown( ICommand& command )
{
    LBERROR << "Unknown " << command << " for " << lunchbox::className( this )
            << lunchbox::backtrace << std::endl;
    return false;
}

}
