#include <gtest/gtest.h>

#include "format_registry.h"
#include "request.h"

class RequestTest : public ::testing::Test {
protected:
    format_registry registry;

    status_t parse(const json& body)
    {
        return parse_generation_request(body, registry, req);
    }

    generation_request req;
};

TEST_F(RequestTest, DefaultsApply)
{
    ASSERT_TRUE(parse({ { "data", "HELLO" }, { "format", "code128" } }).ok());
    EXPECT_EQ(req.data, "HELLO");
    EXPECT_EQ(req.format, "code128");
    EXPECT_DOUBLE_EQ(req.style.module_width, DEFAULT_MODULE_WIDTH);
    EXPECT_DOUBLE_EQ(req.style.module_height, DEFAULT_MODULE_HEIGHT);
    EXPECT_DOUBLE_EQ(req.style.quiet_zone, DEFAULT_QUIET_ZONE);
    EXPECT_EQ(req.style.font_size, DEFAULT_FONT_SIZE);
    EXPECT_EQ(req.style.foreground.r, 0);
    EXPECT_EQ(req.style.background.g, 255);
    EXPECT_EQ(req.return_format, RETURN_INLINE);
}

TEST_F(RequestTest, FormatIsNormalised)
{
    ASSERT_TRUE(parse({ { "data", " 123456789012 " }, { "format", " EAN13" } }).ok());
    EXPECT_EQ(req.format, "ean13");
    EXPECT_EQ(req.data, "123456789012");
}

TEST_F(RequestTest, MissingFields)
{
    status_t st = parse({ { "format", "code128" } });
    EXPECT_EQ(st.code, STATUS_VALIDATION_ERROR);
    EXPECT_EQ(st.msg, "data is required");

    st = parse({ { "data", "x" } });
    EXPECT_EQ(st.code, STATUS_VALIDATION_ERROR);
    EXPECT_EQ(st.msg, "format is required");

    st = parse(json::array());
    EXPECT_EQ(st.code, STATUS_VALIDATION_ERROR);
}

TEST_F(RequestTest, EmptyDataAndUnknownFormat)
{
    status_t st = parse({ { "data", "   " }, { "format", "code128" } });
    EXPECT_EQ(st.code, STATUS_VALIDATION_ERROR);
    EXPECT_EQ(st.msg, "data cannot be empty");

    st = parse({ { "data", "x" }, { "format", "datamatrix" } });
    EXPECT_EQ(st.code, STATUS_VALIDATION_ERROR);
    EXPECT_EQ(st.msg, "unsupported format");
}

TEST_F(RequestTest, WrongFieldTypes)
{
    status_t st = parse({ { "data", 42 }, { "format", "code128" } });
    EXPECT_EQ(st.msg, "data must be a string");

    st = parse({ { "data", "x" }, { "format", "code128" }, { "width", "wide" } });
    EXPECT_EQ(st.msg, "width must be a number");

    st = parse({ { "data", "x" }, { "format", "code128" }, { "font_size", 10.5 } });
    EXPECT_EQ(st.msg, "font_size must be an integer");
}

TEST_F(RequestTest, DimensionsMustBePositive)
{
    for (const char* field : { "width", "height", "quiet_zone", "text_distance" }) {
        json body = { { "data", "x" }, { "format", "code128" } };
        body[field] = 0;
        status_t st = parse(body);
        EXPECT_EQ(st.code, STATUS_VALIDATION_ERROR) << field;
        EXPECT_EQ(st.msg, std::string(field) + " must be positive");

        body[field] = -1.5;
        EXPECT_EQ(parse(body).code, STATUS_VALIDATION_ERROR) << field;
    }
}

TEST_F(RequestTest, FontSizeBoundaries)
{
    json body = { { "data", "x" }, { "format", "code128" } };
    body["font_size"] = 0;
    EXPECT_EQ(parse(body).msg, "font_size must be between 1 and 100");
    body["font_size"] = 101;
    EXPECT_EQ(parse(body).code, STATUS_VALIDATION_ERROR);
    body["font_size"] = 1;
    EXPECT_TRUE(parse(body).ok());
    body["font_size"] = 100;
    EXPECT_TRUE(parse(body).ok());
}

TEST_F(RequestTest, FixedLengthFormats)
{
    EXPECT_TRUE(parse({ { "data", "123456789012" }, { "format", "ean13" } }).ok());

    status_t st = parse({ { "data", "12345" }, { "format", "ean13" } });
    EXPECT_EQ(st.code, STATUS_VALIDATION_ERROR);
    EXPECT_EQ(st.msg, "invalid data length/format for ean13");

    EXPECT_TRUE(parse({ { "data", "12345678901" }, { "format", "upc" } }).ok());
    EXPECT_EQ(parse({ { "data", "1234567890A" }, { "format", "upc" } }).code, STATUS_VALIDATION_ERROR);
    EXPECT_EQ(parse({ { "data", "123456789012" }, { "format", "upc" } }).code, STATUS_VALIDATION_ERROR);

    EXPECT_TRUE(parse({ { "data", "1234567" }, { "format", "ean8" } }).ok());
    EXPECT_TRUE(parse({ { "data", "123456789" }, { "format", "isbn10" } }).ok());
}

TEST_F(RequestTest, Colors)
{
    ASSERT_TRUE(parse({ { "data", "x" }, { "format", "code128" },
        { "foreground", "#FF8000" }, { "background_color", "navy" } })
                    .ok());
    EXPECT_EQ(req.style.foreground.r, 255);
    EXPECT_EQ(req.style.foreground.g, 128);
    EXPECT_EQ(req.style.foreground.b, 0);
    EXPECT_EQ(req.style.background.b, 128);

    // the primary key wins over its alias
    ASSERT_TRUE(parse({ { "data", "x" }, { "format", "code128" },
        { "foreground", "red" }, { "foreground_color", "blue" } })
                    .ok());
    EXPECT_EQ(req.style.foreground.r, 255);
    EXPECT_EQ(req.style.foreground.b, 0);

    status_t st = parse({ { "data", "x" }, { "format", "code128" }, { "foreground", "#12345" } });
    EXPECT_EQ(st.code, STATUS_VALIDATION_ERROR);
    EXPECT_EQ(st.msg, "foreground is not a valid color");
}

TEST(ParseColor, ShortHexAndNames)
{
    color_t c {};
    ASSERT_TRUE(parse_color("fill_color", "#f0a", c).ok());
    EXPECT_EQ(c.r, 0xff);
    EXPECT_EQ(c.g, 0x00);
    EXPECT_EQ(c.b, 0xaa);

    ASSERT_TRUE(parse_color("fill_color", " White ", c).ok());
    EXPECT_EQ(c.r, 255);

    EXPECT_FALSE(parse_color("fill_color", "chartreuse-ish", c).ok());
    EXPECT_FALSE(parse_color("fill_color", "#GGGGGG", c).ok());
}

TEST(ParseReturnFormat, Aliases)
{
    return_format_t fmt = RETURN_INLINE;
    ASSERT_TRUE(parse_return_format("image", fmt).ok());
    EXPECT_EQ(fmt, RETURN_FILE);
    ASSERT_TRUE(parse_return_format("BASE64", fmt).ok());
    EXPECT_EQ(fmt, RETURN_INLINE);
    ASSERT_TRUE(parse_return_format("png", fmt).ok());
    EXPECT_EQ(fmt, RETURN_FILE);
    EXPECT_EQ(parse_return_format("gif", fmt).code, STATUS_VALIDATION_ERROR);
}

TEST(QrRequest, Defaults)
{
    qr_request req;
    ASSERT_TRUE(parse_qr_request({ { "data", "https://example.com" } }, req).ok());
    EXPECT_EQ(req.version, 1);
    EXPECT_EQ(req.error_correction, 'M');
    EXPECT_EQ(req.box_size, 10);
    EXPECT_EQ(req.border, 4);
    EXPECT_EQ(req.return_format, RETURN_INLINE);
    // black on white
    EXPECT_EQ(req.fill.r, 0);
    EXPECT_EQ(req.fill.g, 0);
    EXPECT_EQ(req.fill.b, 0);
    EXPECT_EQ(req.back.r, 255);
    EXPECT_EQ(req.back.g, 255);
    EXPECT_EQ(req.back.b, 255);
}

TEST(QrRequest, FieldsAndLimits)
{
    qr_request req;
    ASSERT_TRUE(parse_qr_request({ { "data", "x" }, { "version", 40 }, { "error_correction", "h" },
                                     { "box_size", 1 }, { "border", 0 }, { "fill_color", "#00f" },
                                     { "return_format", "image" } },
        req)
                    .ok());
    EXPECT_EQ(req.version, 40);
    EXPECT_EQ(req.error_correction, 'H');
    EXPECT_EQ(req.fill.b, 255);
    EXPECT_EQ(req.return_format, RETURN_FILE);

    EXPECT_EQ(parse_qr_request({ { "data", "x" }, { "version", 41 } }, req).msg,
        "version must be between 1 and 40");
    EXPECT_EQ(parse_qr_request({ { "data", "x" }, { "version", 0 } }, req).code, STATUS_VALIDATION_ERROR);
    EXPECT_EQ(parse_qr_request({ { "data", "x" }, { "error_correction", "X" } }, req).msg,
        "error_correction must be one of L, M, Q, H");
    EXPECT_EQ(parse_qr_request({ { "data", "x" }, { "error_correction", "LM" } }, req).code,
        STATUS_VALIDATION_ERROR);
    EXPECT_EQ(parse_qr_request({ { "data", "x" }, { "box_size", 0 } }, req).msg,
        "box_size must be between 1 and 100");
    EXPECT_EQ(parse_qr_request({ { "data", "x" }, { "border", 101 } }, req).msg,
        "border must be between 0 and 100");
    EXPECT_EQ(parse_qr_request({ { "data", "" } }, req).msg, "data cannot be empty");
    EXPECT_EQ(parse_qr_request({ { "version", 2 } }, req).msg, "data is required");
}
