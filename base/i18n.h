// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef I18N_H_9035718264901753
#define I18N_H_9035718264901753

#include <cstdint>
#include <cstdlib>
#include <memory>
#include "string_tools.h"
#include "thread.h"


//minimal layer enabling text translation - without platform/library dependencies!

#define FERRY_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        ferry::translate(FERRY_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) ferry::translate(FERRY_TRANS_CONCAT_SUB(L, s), FERRY_TRANS_CONCAT_SUB(L, p), n)
//source and translation are required to use %x as number placeholder
//for plural form, which will be substituted automatically!!!

namespace ferry
{
//implement handler to enable program-wide localizations:
struct TranslationHandler
{
    //THREAD-SAFETY: "const" member must model thread-safe access!
    TranslationHandler() {}
    virtual ~TranslationHandler() {}

    virtual std::wstring translate(const std::wstring& text) const = 0; //simple translation
    virtual std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n) const = 0;

private:
    TranslationHandler           (const TranslationHandler&) = delete;
    TranslationHandler& operator=(const TranslationHandler&) = delete;
};

void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler); //take ownership
std::shared_ptr<const TranslationHandler> getTranslator();








//######################## implementation ##############################
namespace impl
{
inline Protected<std::shared_ptr<const TranslationHandler>> globalTranslationHandler;
}

inline
std::shared_ptr<const TranslationHandler> getTranslator()
{
    return impl::globalTranslationHandler.access([](const std::shared_ptr<const TranslationHandler>& t) { return t; });
}


inline
void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler)
{
    std::shared_ptr<const TranslationHandler> handler = std::move(newHandler);
    impl::globalTranslationHandler.access([&](std::shared_ptr<const TranslationHandler>& t) { t.swap(handler); });
}


inline
std::wstring translate(const std::wstring& text)
{
    if (std::shared_ptr<const TranslationHandler> t = getTranslator()) //temporarily take (shared) ownership while using the interface!
        return t->translate(text);
    return text;
}


//translate plural forms: "%x second" "%x seconds"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);

    assert(contains(plural, L"%x"));

    if (std::shared_ptr<const TranslationHandler> t = getTranslator())
        return t->translate(singular, plural, n64);

    return replaceCpy(std::abs(n64) == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n64));
}
}

#endif //I18N_H_9035718264901753
