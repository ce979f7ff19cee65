/***********************************************************************
    This file is in the public domain.

    Description:

    Unit tests of resolve_format(), the terse format string matcher.

***********************************************************************/

#include <gtest/gtest.h>
#include <fwcam/fwcam_formats.hpp>

using namespace fwcam;

namespace
{
    std::set<std::string> mono_800x600()
    {
        std::set<std::string> names;
        names.insert("800x600 Mono 8-bit");
        names.insert("800x600 Mono 16-bit");
        return names;
    }

    std::set<std::string> whole_catalog()
    {
        std::set<std::string> names;
        for (const Format_descriptor &entry : all_formats())
            names.insert(entry.name);
        return names;
    }

    Fwcam_error resolve_error(const std::string &user_string, const std::set<std::string> &names)
    {
        try
        {
            resolve_format(user_string, names);
        }
        catch (const failure &f)
        {
            return f.code();
        }
        ADD_FAILURE() << "'" << user_string << "' resolved without error";
        return FWCAM_ERROR_GENERIC_BACKEND_ERROR;
    }
}

TEST(FormatMatcher, UnderspecifiedIsAmbiguous) {
    EXPECT_EQ(resolve_error("800x600 mono", mono_800x600()), FWCAM_ERROR_AMBIGUOUS);
}

TEST(FormatMatcher, AmbiguityMessageListsCandidates) {
    try
    {
        resolve_format("800x600 mono", mono_800x600());
        FAIL() << "expected Ambiguous";
    }
    catch (const failure &f)
    {
        const std::string what(f.what());
        EXPECT_NE(what.find("800x600 Mono 8-bit"), std::string::npos);
        EXPECT_NE(what.find("800x600 Mono 16-bit"), std::string::npos);
    }
}

TEST(FormatMatcher, FullySpecifiedResolvesToOne) {
    const Format_descriptor descriptor = resolve_format("800x600 mono 8-bit", mono_800x600());
    EXPECT_EQ(descriptor.name, "800x600 Mono 8-bit");
    EXPECT_EQ(descriptor.group, 1);
    EXPECT_EQ(descriptor.mode, 2);
}

TEST(FormatMatcher, TokenOrderAndCaseDoNotMatter) {
    EXPECT_EQ(resolve_format("MONO 8-BIT 800x600", mono_800x600()).name, "800x600 Mono 8-bit");
    EXPECT_EQ(resolve_format("16-bit   800x600\tmono", mono_800x600()).name, "800x600 Mono 16-bit");
}

TEST(FormatMatcher, ShortTokenIsInvalidInput) {
    EXPECT_EQ(resolve_error("zz", mono_800x600()), FWCAM_ERROR_INVALID_INPUT);
    EXPECT_EQ(resolve_error("800x600 8b", mono_800x600()), FWCAM_ERROR_INVALID_INPUT);
}

TEST(FormatMatcher, EmptyStringIsInvalidInput) {
    EXPECT_EQ(resolve_error("", mono_800x600()), FWCAM_ERROR_INVALID_INPUT);
    EXPECT_EQ(resolve_error("   ", mono_800x600()), FWCAM_ERROR_INVALID_INPUT);
}

TEST(FormatMatcher, NoMatchIsUnsupported) {
    EXPECT_EQ(resolve_error("1024x768", mono_800x600()), FWCAM_ERROR_UNSUPPORTED);
    EXPECT_EQ(resolve_error("800x600 rgb", mono_800x600()), FWCAM_ERROR_UNSUPPORTED);
    EXPECT_EQ(resolve_error("mono 8-bit", std::set<std::string>()), FWCAM_ERROR_UNSUPPORTED);
}

TEST(FormatMatcher, OnlySupportedNamesAreCandidates) {
    // "mono 8-bit" is ambiguous in the catalog but not among these two.
    EXPECT_EQ(resolve_error("mono 8-bit", whole_catalog()), FWCAM_ERROR_AMBIGUOUS);
    EXPECT_EQ(resolve_format("mono 8-bit", mono_800x600()).name, "800x600 Mono 8-bit");
}

TEST(FormatMatcher, SupportedNameOutsideCatalogIsNotFound) {
    std::set<std::string> names;
    names.insert("640x480 Mono 12-bit");
    EXPECT_EQ(resolve_error("12-bit", names), FWCAM_ERROR_NOT_FOUND);
}

TEST(FormatMatcher, EveryCatalogNameResolvesToItself) {
    const std::set<std::string> names = whole_catalog();
    for (const Format_descriptor &entry : all_formats())
        EXPECT_EQ(resolve_format(entry.name, names), entry) << entry.name;
}
