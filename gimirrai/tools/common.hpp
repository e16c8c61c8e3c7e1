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
 * @file tools/common.hpp
 *
 * Helpers shared by command line tools.
 */

#ifndef gimirrai_tools_common_hpp_included_
#define gimirrai_tools_common_hpp_included_

#include <iostream>
#include <sstream>
#include <string>

#include <boost/filesystem/path.hpp>

#include "dbglog/dbglog.hpp"
#include "utility/streams.hpp"

#include "jsoncpp/json.hpp"

#include "gimirrai/config.hpp"
#include "gimirrai/provider.hpp"

namespace gimirrai { namespace tools {

/** Provider definition from a configured collection or directly from data
 *  file when no configuration is given.
 */
inline ProviderDefinition
providerDefinition(ProviderType type, const boost::filesystem::path &data
                   , const boost::filesystem::path &config
                   , const std::string &collection)
{
    if (!config.empty()) {
        const auto cfg(loadConfig(config));
        return cfg.provider(collection, type);
    }

    ProviderDefinition pd;
    pd.type = type;
    pd.name = ((type == ProviderType::coverage)
               ? "gimirrai.providers.GimiCoverageProvider"
               : "gimirrai.providers.GimiTileProvider");
    pd.data = data.string();
    return pd;
}

/** Writes data to given file, "-" means stdout.
 */
template <typename Container>
void write(const boost::filesystem::path &path, const Container &data)
{
    if (path.string() == "-") {
        std::cout.write(data.data(), data.size());
        std::cout.flush();
        return;
    }

    LOG(info3) << "Writing " << data.size() << " bytes into " << path << ".";
    utility::ofstreambuf f(path.string());
    f.write(data.data(), data.size());
    f.close();
}

inline void write(const boost::filesystem::path &path
                  , const Json::Value &value)
{
    std::ostringstream os;
    Json::StyledStreamWriter("  ").write(os, value);
    write(path, os.str());
}

} } // namespace gimirrai::tools

#endif // gimirrai_tools_common_hpp_included_
