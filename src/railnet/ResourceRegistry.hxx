/** \copyright
 * Copyright (c) 2024, railnet contributors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *  - Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 *  - Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 *
 * \file railnet/ResourceRegistry.hxx
 *
 * Creates hardware resources lazily, at most once per address.
 *
 * @date 6 March 2024
 */

#ifndef _RAILNET_RESOURCEREGISTRY_HXX_
#define _RAILNET_RESOURCEREGISTRY_HXX_

#include <functional>
#include <map>
#include <memory>

#include "os/OS.hxx"

namespace railnet
{

/** Map from an address to the resource initialized for it. A failed
 * creation is not remembered, so the next request tries again.
 * @param Key address type
 * @param T resource type
 */
template <class Key, class T> class ResourceRegistry
{
public:
    /// Creates the resource for an address; nullptr on failure.
    typedef std::function<std::unique_ptr<T>(const Key &)> Factory;

    ResourceRegistry()
    {
    }

    /** Returns the resource of an address, creating it on first use.
     * @param key address
     * @param factory called at most once per successful address
     * @param created set to true if this call created the resource
     * @return the resource, or nullptr if creation failed
     */
    T *get_or_create(const Key &key, const Factory &factory,
        bool *created = nullptr)
    {
        if (created)
        {
            *created = false;
        }
        OSMutexLock l(&lock_);
        auto it = resources_.find(key);
        if (it != resources_.end())
        {
            return it->second.get();
        }
        std::unique_ptr<T> res = factory(key);
        if (!res)
        {
            return nullptr;
        }
        T *ret = res.get();
        resources_[key] = std::move(res);
        if (created)
        {
            *created = true;
        }
        return ret;
    }

    /// @return the resource of an address, or nullptr if none exists yet.
    T *find(const Key &key)
    {
        OSMutexLock l(&lock_);
        auto it = resources_.find(key);
        return it == resources_.end() ? nullptr : it->second.get();
    }

    /// @return number of resources held.
    size_t size()
    {
        OSMutexLock l(&lock_);
        return resources_.size();
    }

    /// Destroys every resource.
    void clear()
    {
        OSMutexLock l(&lock_);
        resources_.clear();
    }

private:
    OSMutex lock_;
    std::map<Key, std::unique_ptr<T>> resources_;

    DISALLOW_COPY_AND_ASSIGN(ResourceRegistry);
};

} // namespace railnet

#endif // _RAILNET_RESOURCEREGISTRY_HXX_
