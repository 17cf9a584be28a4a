#ifndef SBSYNC_COMMON_HPP
#define SBSYNC_COMMON_HPP

#ifdef SBSYNC_HAVE_TESTS
#define SBSYNC_VIRTUAL_WITH_TESTS virtual
#define SBSYNC_PROTECTED_WITH_TESTS_ELSE_PRIVATE protected
#else
#define SBSYNC_VIRTUAL_WITH_TESTS
#define SBSYNC_PROTECTED_WITH_TESTS_ELSE_PRIVATE private
#endif

#endif // SBSYNC_COMMON_HPP
