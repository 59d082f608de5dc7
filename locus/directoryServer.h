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

#ifndef LOCUS_DIRECTORYSERVER_H
#define LOCUS_DIRECTORYSERVER_H

#include <locus/server.h> // base class

namespace locus
{
/** Serves a Directory to RemoteDirectory proxies. */
class DirectoryServer : public Server
{
public:
    /** Construct a server for the given directory. @version 1.0 */
    LOCUS_API explicit DirectoryServer( DirectoryPtr directory );

    LOCUS_API virtual ~DirectoryServer();

    /** @return the served directory. @version 1.0 */
    DirectoryPtr getDirectory() const { return _directory; }

private:
    DirectoryPtr _directory;

    void _cmdAllocate( ICommand& command, OCommand& reply );
    void _cmdResolve( ICommand& command, OCommand& reply );
    void _cmdUpdateLocation( ICommand& command, OCommand& reply );
    void _cmdRegisterNode( ICommand& command, OCommand& reply );
    void _cmdGetNodes( ICommand& command, OCommand& reply );
};
}

#endif // LOCUS_DIRECTORYSERVER_H
