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

#ifndef LOCUS_LOCALDIRECTORY_H
#define LOCUS_LOCALDIRECTORY_H

#include <locus/directory.h> // base class

namespace locus
{
namespace detail { class LocalDirectory; }

/**
 * An in-memory, thread-safe Directory.
 *
 * Used by the directory daemon behind a DirectoryServer, and directly by
 * kernel servers running in the same process.
 */
class LocalDirectory : public Directory
{
public:
    LOCUS_API LocalDirectory();

    LOCUS_API OID allocate( const NodeAddress& node ) override;
    LOCUS_API NodeAddress resolve( const OID& oid ) override;
    LOCUS_API void updateLocation( const OID& oid,
                                   const NodeAddress& node ) override;
    LOCUS_API void registerNode( const NodeAddress& node,
                                 const std::string& region ) override;
    LOCUS_API NodeAddresses getNodes( const std::string& region ) override;

    /** @return the number of allocated identifiers. @version 1.0 */
    LOCUS_API size_t getNumObjects() const;

    /** @return the identifiers located on the given node. @version 1.0 */
    LOCUS_API OIDs getObjects( const NodeAddress& node ) const;

protected:
    LOCUS_API virtual ~LocalDirectory();

private:
    detail::LocalDirectory* const _impl;
};
}

#endif // LOCUS_LOCALDIRECTORY_H
