#include <mishap/error/system_failure.hpp>

#include <boost/predef.h>

#if defined BOOST_OS_WINDOWS_AVAILABLE
#include <boost/outcome/experimental/status-code/win32_code.hpp>
#elif defined BOOST_OS_LINUX_AVAILABLE || defined BOOST_OS_MACOS_AVAILABLE
#include <cerrno>
#include <boost/outcome/experimental/status-code/posix_code.hpp>
#endif

namespace mishap
{

auto collect_system_error(std::string_view api) noexcept -> system_failure
{
#if defined BOOST_OS_WINDOWS_AVAILABLE
    return system_failure{system_error::win32_code::current(), api};
#elif defined BOOST_OS_LINUX_AVAILABLE || defined BOOST_OS_MACOS_AVAILABLE
    return system_failure{system_error::posix_code::current(), api};
#endif
}

} // namespace mishap
