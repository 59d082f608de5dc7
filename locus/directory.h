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

#ifndef LOCUS_DIRECTORY_H
#define LOCUS_DIRECTORY_H

#include <locus/api.h>
#include <locus/types.h>

#include <lunchbox/referenced.h> // base class

namespace locus
{
/**
 * The cluster-wide authority mapping object identifiers to their host.
 *
 * Kernel servers allocate identifiers for new objects and update the
 * location of moved objects. Callers resolve the current host of an object.
 * Implementations raise an Exception of type DIRECTORY_UNAVAILABLE if the
 * directory can't be reached.
 */
class Directory : public lunchbox::Referenced
{
public:
    /**
     * Allocate a new, never used identifier hosted on the given node.
     * @version 1.0
     */
    virtual OID allocate( const NodeAddress& node ) = 0;

    /**
     * @return the node currently hosting the object.
     * @throw Exception UNKNOWN_OID if the identifier was never allocated.
     * @version 1.0
     */
    virtual NodeAddress resolve( const OID& oid ) = 0;

    /**
     * Set the node hosting the object.
     *
     * Updating to the current location has no effect.
     * @throw Exception UNKNOWN_OID if the identifier was never allocated.
     * @version 1.0
     */
    virtual void updateLocation( const OID& oid, const NodeAddress& node ) = 0;

    /**
     * Register a kernel server node.
     *
     * Registering a node again updates its region.
     * @version 1.0
     */
    virtual void registerNode( const NodeAddress& node,
                               const std::string& region ) = 0;

    /**
     * @return the registered nodes of a region, or all nodes for an empty
     *         region, in ascending order.
     * @version 1.0
     */
    virtual NodeAddresses getNodes( const std::string& region ) = 0;

protected:
    Directory() {}
    virtual ~Directory() {}
};
}

#endif // LOCUS_DIRECTORY_H
