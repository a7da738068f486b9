#ifndef SW_PERMISSION_CHECK
#define SW_PERMISSION_CHECK

#include <string>

// Allow/deny gate consulted before a url is visited.
class PermissionCheck {
public:
    virtual ~PermissionCheck() = default;
    virtual bool isAllowed(const std::string& url, const std::string& userAgent) const = 0;
};

#endif
