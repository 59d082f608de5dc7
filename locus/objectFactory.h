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

#ifndef LOCUS_OBJECTFACTORY_H
#define LOCUS_OBJECTFACTORY_H

#include <locus/object.h>       // deleted inline

namespace locus
{
    /**
     * The interface to create application objects by type name.
     *
     * Used by the ObjectRegistry to instantiate newly created objects, and to
     * instantiate objects received by migration. All kernel servers of a
     * cluster have to know the same types.
     */
    class ObjectFactory
    {
    public:
        /** @internal Construct a new object factory. */
        ObjectFactory(){}

        /** @internal Destruct this object factory. */
        virtual ~ObjectFactory(){}

        /**
         * @return a new object instance of the given type, or 0 if the type
         *         is unknown.
         * @version 1.0
         */
        virtual Object* createObject( const std::string& /*type*/ )
            { return 0; }

        /** Delete the given object of the given type. @version 1.0 */
        virtual void destroyObject( Object* object,
                                    const std::string& /*type*/ )
            { delete object; }
    };
}
#endif // LOCUS_OBJECTFACTORY_H
