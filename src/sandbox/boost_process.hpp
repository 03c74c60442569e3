#pragma once

#include <boost/version.hpp>

// Boost 1.86 moved the classic API under boost::process::v1.
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
namespace scriptbox::sandbox {
namespace bp = boost::process::v1;
}  // namespace scriptbox::sandbox
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
namespace scriptbox::sandbox {
namespace bp = boost::process;
}  // namespace scriptbox::sandbox
#endif
