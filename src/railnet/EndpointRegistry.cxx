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
 * \file railnet/EndpointRegistry.cxx
 *
 * Implementation of the endpoint registry.
 *
 * @date 10 March 2024
 */

#include "railnet/EndpointRegistry.hxx"

#include "utils/logging.h"

namespace railnet
{

EndpointRegistry::EndpointRegistry(
    const LinkConfig &config, LinkListener *listener)
    : config_(config)
    , listener_(listener)
    , shutdown_(false)
{
    HASSERT(listener_);
}

EndpointRegistry::~EndpointRegistry()
{
    shutdown(0);
}

std::unique_ptr<Link> EndpointRegistry::create_link(
    const EndpointAddress &address, const string &alias)
{
    return std::unique_ptr<Link>(
        new ClientLink(address.host, address.port, alias, config_, listener_));
}

std::shared_ptr<Link> EndpointRegistry::add_endpoint(
    const EndpointAddress &address, long long wait_nsec)
{
    string alias = address.alias();
    std::shared_ptr<Link> link;
    {
        OSMutexLock l(&lock_);
        if (shutdown_)
        {
            return nullptr;
        }
        auto it = links_.find(alias);
        if (it != links_.end())
        {
            return it->second;
        }
        link = create_link(address, alias);
        links_[alias] = link;
        LOG(INFO, "Endpoint %s added", alias.c_str());
        link->start();
    }
    if (!link->wait_for_active(wait_nsec))
    {
        LOG(WARNING, "Endpoint %s not connected yet", alias.c_str());
    }
    return link;
}

bool EndpointRegistry::remove_endpoint(const string &alias)
{
    std::shared_ptr<Link> link;
    {
        OSMutexLock l(&lock_);
        auto it = links_.find(alias);
        if (it == links_.end())
        {
            return false;
        }
        link = std::move(it->second);
        links_.erase(it);
    }
    link->stop();
    link->join();
    LOG(INFO, "Endpoint %s removed", alias.c_str());
    return true;
}

std::shared_ptr<Link> EndpointRegistry::find(const string &alias)
{
    OSMutexLock l(&lock_);
    auto it = links_.find(alias);
    if (it == links_.end())
    {
        return nullptr;
    }
    return it->second;
}

bool EndpointRegistry::send_to(const string &alias, const string &message)
{
    std::shared_ptr<Link> link = find(alias);
    if (!link)
    {
        LOG_ERROR("Message [%s] for unknown endpoint %s", message.c_str(),
            alias.c_str());
        return false;
    }
    return link->send(message);
}

std::vector<string> EndpointRegistry::aliases()
{
    OSMutexLock l(&lock_);
    std::vector<string> out;
    for (auto &kv : links_)
    {
        out.push_back(kv.first);
    }
    return out;
}

void EndpointRegistry::shutdown(long long grace_nsec)
{
    std::map<string, std::shared_ptr<Link>> links;
    {
        OSMutexLock l(&lock_);
        shutdown_ = true;
        links.swap(links_);
    }
    if (links.empty())
    {
        return;
    }
    for (auto &kv : links)
    {
        kv.second->stop();
    }
    long long deadline = OSTime::get_monotonic() + grace_nsec;
    for (auto &kv : links)
    {
        while (!kv.second->is_finished() &&
            OSTime::get_monotonic() < deadline)
        {
            OSThread::sleep_nsec(MSEC_TO_NSEC(10));
        }
        if (!kv.second->is_finished())
        {
            LOG(WARNING, "Endpoint %s still closing after the grace period",
                kv.first.c_str());
        }
    }
    for (auto &kv : links)
    {
        kv.second->join();
    }
    LOG(INFO, "%u endpoints shut down", (unsigned)links.size());
}

} // namespace railnet
