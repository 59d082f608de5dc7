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

#ifndef LOCUS_REMOTEDIRECTORY_H
#define LOCUS_REMOTEDIRECTORY_H

#include <locus/directory.h> // base class

namespace locus
{
namespace detail { class RemoteDirectory; }

/**
 * A proxy for a Directory served by a DirectoryServer.
 *
 * Network failures are reported as DIRECTORY_UNAVAILABLE, errors of the
 * directory itself are passed through.
 */
class RemoteDirectory : public Directory
{
public:
    /** Construct a proxy for the directory at the given address. */
    LOCUS_API explicit RemoteDirectory( const NodeAddress& address );

    LOCUS_API OID allocate( const NodeAddress& node ) override;
    LOCUS_API NodeAddress resolve( const OID& oid ) override;
    LOCUS_API void updateLocation( const OID& oid,
                                   const NodeAddress& node ) override;
    LOCUS_API void registerNode( const NodeAddress& node,
                                 const std::string& region ) override;
    LOCUS_API NodeAddresses getNodes( const std::string& region ) override;

    /** @return the address of the directory server. @version 1.0 */
    LOCUS_API const NodeAddress& getAddress() const;

protected:
    LOCUS_API virtual ~RemoteDirectory();

private:
    detail::RemoteDirectory* const _impl;
};
}

#endif // LOCUS_REMOTEDIRECTORY_H
