/**
 * Copyright (c) 2024 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */
#include <map>
#include <mutex>
#include <utility>

#include "dbglog/dbglog.hpp"

#include "./provider.hpp"
#include "./coverage.hpp"
#include "./tiles.hpp"

namespace gimirrai {

namespace {

typedef std::pair<ProviderType, std::string> Key;

struct Registry {
    std::mutex mutex;
    std::map<Key, ProviderFactory> factories;
    bool builtins = false;
};

Registry& registry()
{
    static Registry r;
    return r;
}

template <typename ProviderT>
Provider::pointer make(const ProviderDefinition &definition)
{
    return Provider::pointer(new ProviderT(definition));
}

void insert(Registry &r, ProviderType type, const std::string &name
            , const ProviderFactory &factory)
{
    LOG(info1) << "Registering " << type << " provider <" << name << ">.";
    r.factories[Key(type, name)] = factory;
}

/** Built-in providers go in first so that user registrations replace them.
 *  Called with registry lock held.
 */
void registerBuiltins(Registry &r)
{
    if (r.builtins) { return; }
    r.builtins = true;

    for (const auto *name : {
            "gimirrai.providers.GimiCoverageProvider"
            , "gimirrai.pygeoapi_providers.gimi.GimiCoverageProvider"
        })
    {
        insert(r, ProviderType::coverage, name
               , &make<CoverageProvider>);
    }

    for (const auto *name : {
            "gimirrai.providers.GimiTileProvider"
            , "gimirrai.pygeoapi_providers.gimi.GimiTileProvider"
        })
    {
        insert(r, ProviderType::tile, name, &make<TileProvider>);
    }
}

} // namespace

Provider::Provider(const ProviderDefinition &definition)
    : definition_(definition)
{}

Provider::~Provider() {}

void registerProvider(ProviderType type, const std::string &name
                      , const ProviderFactory &factory)
{
    auto &r(registry());
    std::lock_guard<std::mutex> lock(r.mutex);
    registerBuiltins(r);
    insert(r, type, name, factory);
}

Provider::pointer createProvider(const ProviderDefinition &definition)
{
    ProviderFactory factory;
    {
        auto &r(registry());
        std::lock_guard<std::mutex> lock(r.mutex);
        registerBuiltins(r);
        auto ff(r.factories.find(Key(definition.type, definition.name)));
        if (ff == r.factories.end()) {
            LOGTHROW(err2, ProviderNotFoundError)
                << "No " << definition.type << " provider named <"
                << definition.name << "> found.";
        }
        factory = ff->second;
    }

    LOG(info2) << "Creating " << definition.type << " provider <"
               << definition.name << "> for " << definition.data << ".";
    return factory(definition);
}

} // namespace gimirrai
