#include <gtest/gtest.h>

#include "format_registry.h"

TEST(FormatRegistry, ListsEveryFormatInOrder)
{
    format_registry registry;
    std::vector<std::string> expected = {
        "code128", "code39", "ean8", "ean13", "ean14", "jan", "upc",
        "isbn10", "isbn13", "issn", "itf", "pzn", "qrcode"
    };
    EXPECT_EQ(registry.ids(), expected);
    EXPECT_EQ(registry.formats().size(), expected.size());
}

TEST(FormatRegistry, LookupIsExactAndCaseSensitive)
{
    format_registry registry;
    ASSERT_NE(registry.lookup("ean13"), nullptr);
    EXPECT_EQ(registry.lookup("ean13")->symbology, ZXing::BarcodeFormat::EAN13);
    EXPECT_EQ(registry.lookup("EAN13"), nullptr);
    EXPECT_EQ(registry.lookup("datamatrix"), nullptr);
    EXPECT_TRUE(registry.contains("qrcode"));
    EXPECT_FALSE(registry.contains(""));
}

TEST(FormatRegistry, QrCodeUsesItsOwnEncoder)
{
    format_registry registry;
    const format_info* qr = registry.lookup("qrcode");
    ASSERT_NE(qr, nullptr);
    EXPECT_EQ(qr->kind, ENCODER_QRCODE);
    for (const auto& f : registry.formats()) {
        if (f.id != "qrcode") {
            EXPECT_EQ(f.kind, ENCODER_LINEAR) << f.id;
        }
    }
}

TEST(FormatRegistry, EncodedTextAppliesPrefixAndSuffix)
{
    format_registry registry;
    EXPECT_EQ(registry.lookup("isbn10")->encoded_text("123456789"), "978123456789");
    EXPECT_EQ(registry.lookup("issn")->encoded_text("0317847"), "977031784700");
    EXPECT_EQ(registry.lookup("pzn")->encoded_text("1234562"), "-1234562");
    EXPECT_EQ(registry.lookup("ean14")->encoded_text("12345678901231"), "\xC3\xB1" "0112345678901231");
    EXPECT_EQ(registry.lookup("code39")->encoded_text("abc-1"), "ABC-1");
    EXPECT_EQ(registry.lookup("code128")->encoded_text("abc-1"), "abc-1");
}

TEST(FormatRegistry, DisplayTextCarriesLabel)
{
    format_registry registry;
    EXPECT_EQ(registry.lookup("isbn13")->display_text("978316148410"), "ISBN 978316148410");
    EXPECT_EQ(registry.lookup("ean14")->display_text("12345678901231"), "(01) 12345678901231");
    EXPECT_EQ(registry.lookup("code128")->display_text("HELLO"), "HELLO");
}

TEST(FormatRegistry, FixedLengths)
{
    format_registry registry;
    EXPECT_EQ(registry.lookup("ean8")->fixed_length, 7u);
    EXPECT_EQ(registry.lookup("ean13")->fixed_length, 12u);
    EXPECT_EQ(registry.lookup("upc")->fixed_length, 11u);
    EXPECT_EQ(registry.lookup("isbn10")->fixed_length, 9u);
    EXPECT_EQ(registry.lookup("code128")->fixed_length, 0u);
}

TEST(FormatRegistry, PayloadPassesUncheckedFormatsThrough)
{
    format_registry registry;
    std::string out;
    ASSERT_TRUE(registry.lookup("code128")->payload("hello world", out).ok());
    EXPECT_EQ(out, "hello world");
    ASSERT_TRUE(registry.lookup("ean13")->payload("123456789012", out).ok());
    EXPECT_EQ(out, "123456789012");
}

TEST(FormatRegistry, Ean14PayloadGetsGtinCheckDigit)
{
    format_registry registry;
    const format_info* ean14 = registry.lookup("ean14");
    ASSERT_NE(ean14, nullptr);

    std::string out;
    ASSERT_TRUE(ean14->payload("1234567890123", out).ok());
    EXPECT_EQ(out, "12345678901231");

    // already complete and correct
    ASSERT_TRUE(ean14->payload("12345678901231", out).ok());
    EXPECT_EQ(out, "12345678901231");

    EXPECT_EQ(ean14->payload("12345678901234", out).code, STATUS_ENCODING_ERROR);
    EXPECT_EQ(ean14->payload("hello", out).code, STATUS_ENCODING_ERROR);
    EXPECT_EQ(ean14->payload("123", out).code, STATUS_ENCODING_ERROR);
    EXPECT_EQ(ean14->payload("123456789012a", out).code, STATUS_ENCODING_ERROR);
}

TEST(FormatRegistry, PznPayloadGetsMod11CheckDigit)
{
    format_registry registry;
    const format_info* pzn = registry.lookup("pzn");
    ASSERT_NE(pzn, nullptr);

    std::string out;
    // 1*2 + 2*3 + 3*4 + 4*5 + 5*6 + 6*7 = 112, 112 % 11 = 2
    ASSERT_TRUE(pzn->payload("123456", out).ok());
    EXPECT_EQ(out, "1234562");
    ASSERT_TRUE(pzn->payload("1234562", out).ok());
    EXPECT_EQ(out, "1234562");

    EXPECT_EQ(pzn->payload("1234563", out).code, STATUS_ENCODING_ERROR);
    EXPECT_EQ(pzn->payload("ABC", out).code, STATUS_ENCODING_ERROR);
    EXPECT_EQ(pzn->payload("12345", out).code, STATUS_ENCODING_ERROR);
    // 5*2 = 10 has no valid check digit
    EXPECT_EQ(pzn->payload("500000", out).code, STATUS_ENCODING_ERROR);
}
