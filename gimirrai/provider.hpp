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
/**
 * @file provider.hpp
 *
 * Provider definitions, provider errors and the provider registry.
 *
 * Providers are looked up by the fully qualified name found in the
 * configuration and created through a factory registered under that name.
 */

#ifndef gimirrai_provider_hpp_included_
#define gimirrai_provider_hpp_included_

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/optional.hpp>

#include "jsoncpp/json.hpp"

#include "utility/enum-io.hpp"

namespace gimirrai {

struct ProviderError : std::runtime_error {
    ProviderError(const std::string &msg) : std::runtime_error(msg) {}
};

/** Data cannot be opened or understood.
 */
struct ProviderConnectionError : ProviderError {
    ProviderConnectionError(const std::string &msg) : ProviderError(msg) {}
};

/** Query cannot be executed.
 */
struct ProviderQueryError : ProviderError {
    ProviderQueryError(const std::string &msg) : ProviderError(msg) {}
};

/** Malformed query parameters.
 */
struct ProviderInvalidQueryError : ProviderError {
    ProviderInvalidQueryError(const std::string &msg) : ProviderError(msg) {}
};

struct ProviderNoDataError : ProviderError {
    ProviderNoDataError(const std::string &msg) : ProviderError(msg) {}
};

struct ProviderTileNotFoundError : ProviderError {
    ProviderTileNotFoundError(const std::string &msg) : ProviderError(msg) {}
};

struct ProviderTilesetIdNotFoundError : ProviderError {
    ProviderTilesetIdNotFoundError(const std::string &msg)
        : ProviderError(msg) {}
};

/** No provider registered under given name.
 */
struct ProviderNotFoundError : ProviderError {
    ProviderNotFoundError(const std::string &msg) : ProviderError(msg) {}
};

enum class ProviderType { coverage, tile };

UTILITY_GENERATE_ENUM_IO(ProviderType,
                         ((coverage)("coverage"))
                         ((tile)("tile"))
                         )

struct ProviderDefinition {
    struct Format {
        std::string name;
        std::string mimetype;
    };

    ProviderType type;

    /** Fully qualified provider name.
     */
    std::string name;

    /** Path to the data file.
     */
    std::string data;

    boost::optional<Format> format;

    /** Provider specific options, always an object.
     */
    Json::Value options;

    ProviderDefinition()
        : type(ProviderType::coverage), options(Json::objectValue)
    {}
};

class Provider {
public:
    typedef std::unique_ptr<Provider> pointer;

    Provider(const ProviderDefinition &definition);
    virtual ~Provider();

    const ProviderDefinition& definition() const { return definition_; }
    ProviderType type() const { return definition_.type; }
    const std::string& data() const { return definition_.data; }
    const Json::Value& options() const { return definition_.options; }

protected:
    const ProviderDefinition definition_;
};

typedef std::function<Provider::pointer(const ProviderDefinition&)>
    ProviderFactory;

/** Registers provider factory under given name. Existing registration is
 *  replaced.
 */
void registerProvider(ProviderType type, const std::string &name
                      , const ProviderFactory &factory);

/** Creates provider by its definition.
 *
 * Throws ProviderNotFoundError when no provider of definition's name and
 * type is registered. Provider constructors throw ProviderConnectionError.
 */
Provider::pointer createProvider(const ProviderDefinition &definition);

/** Creates provider and casts it to expected type.
 */
template <typename ProviderT>
std::unique_ptr<ProviderT> createProvider(const ProviderDefinition &definition)
{
    auto provider(createProvider(definition));
    if (auto *p = dynamic_cast<ProviderT*>(provider.get())) {
        provider.release();
        return std::unique_ptr<ProviderT>(p);
    }
    throw ProviderNotFoundError
        ("Provider <" + definition.name + "> has unexpected type.");
}

} // namespace gimirrai

#endif // gimirrai_provider_hpp_included_
