// no include guard, paired with macro-begin.hpp

#undef S3SIGN_LIFETIMEBOUND
