#ifndef PATHWRIGHT_PATH_HEADER
#define PATHWRIGHT_PATH_HEADER

#if defined(PATHWRIGHT_USE_BOOST_FILESYSTEM)
# include <boost/filesystem/path.hpp>
namespace pathwright { using boost::filesystem::path; }
#elif __cplusplus >= 201703L
# include <filesystem>
namespace pathwright { using std::filesystem::path; }
#elif defined(PATHWRIGHT_USE_EXPERIMENTAL_FILESYSTEM)
# include <experimental/filesystem>
namespace pathwright { using std::experimental::filesystem::path; }
#else
# error "Need boost or std filesystem support."
#endif

#endif // PATHWRIGHT_PATH_HEADER
