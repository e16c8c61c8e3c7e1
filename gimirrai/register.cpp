#include <mutex>

#include <gdal_priv.h>

#include "./register.hpp"
#include "./gimidataset.hpp"

namespace gimirrai {

void registerAll()
{
    static std::once_flag once;
    std::call_once(once, []()
    {
        // our drivers go first, GDAL tries drivers in registration order;
        // put new drivers here
        GDALRegister_Gimi();

        ::GDALAllRegister();
    });
}

} // namespace gimirrai
