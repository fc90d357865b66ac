// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <base/i18n.h>

using namespace ferry;


namespace
{
class UpperCaseTranslation : public TranslationHandler
{
public:
    std::wstring translate(const std::wstring& text) const override
    {
        std::wstring out = text;
        for (wchar_t& c : out)
            if (L'a' <= c && c <= L'z')
                c = c - L'a' + L'A';
        return out;
    }

    std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n) const override
    {
        return replaceCpy(translate(n == 1 ? singular : plural), L"%X", numberTo<std::wstring>(n));
    }
};


class TranslatorTest : public ::testing::Test
{
protected:
    void TearDown() override { setTranslator(nullptr); }
};
}


TEST_F(TranslatorTest, DefaultIsIdentity)
{
    EXPECT_EQ(getTranslator(), nullptr);
    EXPECT_EQ(_("Cannot read file %x."), L"Cannot read file %x.");
    EXPECT_EQ(_P("1 sec", "%x sec", 1), L"1 sec");
    EXPECT_EQ(_P("1 sec", "%x sec", 30), L"30 sec");
}


TEST_F(TranslatorTest, HandlerIsUsed)
{
    setTranslator(std::make_unique<UpperCaseTranslation>());

    EXPECT_EQ(_("Cannot read file."), L"CANNOT READ FILE.");
    EXPECT_EQ(_P("1 sec", "%x sec", 5), L"5 SEC");
}
