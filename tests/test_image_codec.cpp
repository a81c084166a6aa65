#include <catch2/catch_all.hpp>
#include "../documents/image/plx_image_codec.h"
#include <opencv2/imgcodecs.hpp>
#include <vector>

SCENARIO("Image formats are sniffed from content", "[image]") {
    GIVEN("A PNG and a JPEG produced by OpenCV") {
        cv::Mat pixels(8, 8, CV_8UC3, cv::Scalar(255, 0, 0));
        std::string png = plx_image_codec::encode_png(pixels);

        std::vector<uchar> jpeg_buffer;
        REQUIRE(cv::imencode(".jpg", pixels, jpeg_buffer));
        std::string jpeg(jpeg_buffer.begin(), jpeg_buffer.end());

        THEN("libmagic recognizes both regardless of any label") {
            REQUIRE(plx_image_codec::detect_format(png) == "image/png");
            REQUIRE(plx_image_codec::detect_format(jpeg) == "image/jpeg");
            REQUIRE(plx_image_codec::is_native_format("image/png"));
            REQUIRE(plx_image_codec::is_native_format("image/jpeg"));
            REQUIRE_FALSE(plx_image_codec::is_native_format("image/gif"));
        }

        THEN("Both decode to BGR") {
            cv::Mat decoded = plx_image_codec::decode(png);
            REQUIRE(decoded.cols == 8);
            REQUIRE(decoded.rows == 8);
            REQUIRE(decoded.channels() == 3);
            REQUIRE(decoded.at<cv::Vec3b>(0, 0)[0] == 255);
            REQUIRE(plx_image_codec::decode(jpeg).cols == 8);
        }
    }

    GIVEN("Bytes that are not an image") {
        THEN("Sniffing is inconclusive and decoding throws") {
            REQUIRE(plx_image_codec::detect_format("").empty());
            REQUIRE(plx_image_codec::detect_format("just some words").empty());
            REQUIRE_THROWS_AS(plx_image_codec::decode("just some words"), std::runtime_error);
            REQUIRE_THROWS_AS(plx_image_codec::decode(""), std::runtime_error);
        }
    }
}

SCENARIO("Decoded rasters become PNG files", "[image]") {
    GIVEN("A 3x2 BGR raster") {
        plx_raster raster;
        raster.width = 3;
        raster.height = 2;
        raster.channels = 3;
        raster.pixels.assign(3 * 2 * 3, '\x40');

        THEN("It encodes to a PNG of the same size") {
            std::string png = plx_image_codec::encode_png(raster);
            cv::Mat back = plx_image_codec::decode(png);
            REQUIRE(back.cols == 3);
            REQUIRE(back.rows == 2);
        }
    }

    GIVEN("Broken rasters") {
        plx_raster short_buffer;
        short_buffer.width = 10;
        short_buffer.height = 10;
        short_buffer.pixels = "abc";

        plx_raster odd_channels;
        odd_channels.width = 1;
        odd_channels.height = 1;
        odd_channels.channels = 2;
        odd_channels.pixels = "ab";

        THEN("Encoding throws") {
            REQUIRE_THROWS_AS(plx_image_codec::encode_png(short_buffer), std::runtime_error);
            REQUIRE_THROWS_AS(plx_image_codec::encode_png(odd_channels), std::runtime_error);
            REQUIRE_THROWS_AS(plx_image_codec::encode_png(plx_raster()), std::runtime_error);
        }
    }
}
