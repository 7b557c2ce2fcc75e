// no include guard, paired with macro-end.hpp

#if defined(__clang__)
#define S3SIGN_LIFETIMEBOUND [[clang::lifetimebound]]
#else
#define S3SIGN_LIFETIMEBOUND
#endif
