// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "credential.h"
#include <algorithm>
#include <openssl/crypto.h>

using namespace ferry;


class impl::SecretBuffer
{
public:
    explicit SecretBuffer(std::string_view data) :
        size_(data.size()),
        data_(std::make_unique<char[]>(data.size() + 1)) //+1 for null-termination
    {
        std::copy(data.begin(), data.end(), data_.get());
        data_[size_] = 0;
    }

    ~SecretBuffer() { ::OPENSSL_cleanse(data_.get(), size_ + 1); }

    const char* c_str() const { return data_.get(); }
    size_t size() const { return size_; }

private:
    SecretBuffer           (const SecretBuffer&) = delete;
    SecretBuffer& operator=(const SecretBuffer&) = delete;

    const size_t size_;
    const std::unique_ptr<char[]> data_;
};


const char* SecureSecret::c_str() const { return buf_->c_str(); }
size_t      SecureSecret::size () const { return buf_->size(); }


Credential::Credential() : Credential(std::string_view()) {}


Credential::Credential(std::string_view password) :
    buf_(std::make_shared<const impl::SecretBuffer>(password)) {}


std::string Credential::plainText() const
{
    return std::string(buf_->c_str(), buf_->size());
}


SecureSecret Credential::secureHandle() const
{
    return SecureSecret(buf_);
}


bool Credential::operator==(const Credential& other) const
{
    if (buf_ == other.buf_)
        return true;

    return buf_->size() == other.buf_->size() &&
           ::CRYPTO_memcmp(buf_->c_str(), other.buf_->c_str(), buf_->size()) == 0;
}
