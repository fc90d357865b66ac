// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CREDENTIAL_H_2504917638842093
#define CREDENTIAL_H_2504917638842093

#include <memory>
#include <string>
#include <string_view>


namespace ferry
{
namespace impl
{
class SecretBuffer;
}

//shared, read-only view of a secret: memory is wiped when the last reference is released
class SecureSecret
{
public:
    const char* c_str() const; //null-terminated
    size_t size() const;
    bool empty() const { return size() == 0; }

private:
    friend class Credential;
    explicit SecureSecret(const std::shared_ptr<const impl::SecretBuffer>& buf) : buf_(buf) {}

    std::shared_ptr<const impl::SecretBuffer> buf_;
};


//immutable password holder
class Credential
{
public:
    Credential();
    explicit Credential(std::string_view password);

    std::string plainText() const;
    SecureSecret secureHandle() const;

    bool operator==(const Credential& other) const; //constant-time comparison

private:
    std::shared_ptr<const impl::SecretBuffer> buf_; //never null
};
}

#endif //CREDENTIAL_H_2504917638842093
