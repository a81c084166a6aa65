#include <catch2/catch_all.hpp>
#include "../documents/layout/plx_layout_reconstructor.h"
#include "../documents/image/plx_image_codec.h"
#include "../utils/plx_exceptions.h"
#include <opencv2/core.hpp>
#include <stdexcept>

using Catch::Approx;

namespace {

struct draw_call
{
  std::string kind;
  std::string content;
  double x;
  double y;
  double width;
  double height;
};

// Records draw calls instead of producing a document
class recording_canvas : public plx_page_canvas
{
public:
  std::vector<draw_call> calls;
  int pages_begun = 0;
  int pages_ended = 0;
  int last_rotation = -1;
  bool fail_finish = false;
  std::string fail_text;

  void begin_page(double, double, int rotation) override {
    pages_begun++;
    last_rotation = rotation;
  }

  void draw_text(const std::string& text, double x, double baseline_y,
                 double font_size, const plx_color&) override {
    if (text == fail_text) {
      throw std::runtime_error("glyph missing");
    }
    calls.push_back({"text", text, x, baseline_y, 0, font_size});
  }

  void draw_image(const std::string& encoded, const std::string& sniffed_mime,
                  double x, double y, double width, double height) override {
    // as the PDF writer does for formats it cannot embed directly
    if (!plx_image_codec::is_native_format(sniffed_mime)) {
      plx_image_codec::decode(encoded);
    }
    calls.push_back({"image", sniffed_mime, x, y, width, height});
  }

  void end_page() override { pages_ended++; }

  std::string finish() override {
    if (fail_finish) {
      throw std::runtime_error("disk full");
    }
    return "%PDF-fake";
  }
};

std::string small_png() {
  cv::Mat pixels(2, 2, CV_8UC3, cv::Scalar(0, 0, 255));
  return plx_image_codec::encode_png(pixels);
}

} // namespace

SCENARIO("Images are painted beneath text", "[reconstructor]") {
    GIVEN("A page with elements [text A, image B, text C]") {
        plx_layout_page page(600, 800);
        page.add_text(plx_layout_text("A", 10, 20, 12));
        plx_layout_image b(100, 200, 50, 40);
        b.data = small_png();
        b.mime_type = "image/png";
        page.add_image(b);
        page.add_text(plx_layout_text("C", 30, 40, 12));

        THEN("The paint order is [B, A, C]") {
            auto order = plx_layout_reconstructor::paint_order(page);
            REQUIRE(order.size() == 3);
            REQUIRE(plx_is_image(*order[0]));
            REQUIRE(std::get<plx_layout_text>(*order[1]).text == "A");
            REQUIRE(std::get<plx_layout_text>(*order[2]).text == "C");
        }

        WHEN("The page is drawn") {
            recording_canvas canvas;
            plx_layout_reconstructor reconstructor;
            std::string data = reconstructor.reconstruct({page}, canvas);

            THEN("The canvas sees the same order in page coordinates") {
                REQUIRE(data == "%PDF-fake");
                REQUIRE(canvas.pages_begun == 1);
                REQUIRE(canvas.pages_ended == 1);
                REQUIRE(canvas.calls.size() == 3);

                REQUIRE(canvas.calls[0].kind == "image");
                REQUIRE(canvas.calls[0].content == "image/png");
                REQUIRE(canvas.calls[0].x == Approx(100));
                // bottom edge: 800 - 200 - 40
                REQUIRE(canvas.calls[0].y == Approx(560));
                REQUIRE(canvas.calls[0].width == Approx(50));
                REQUIRE(canvas.calls[0].height == Approx(40));

                REQUIRE(canvas.calls[1].content == "A");
                REQUIRE(canvas.calls[1].y == Approx(780));
                REQUIRE(canvas.calls[2].content == "C");
                REQUIRE(canvas.calls[2].y == Approx(760));
            }
        }
    }
}

SCENARIO("Element failures do not fail the page", "[reconstructor]") {
    GIVEN("A page with a corrupt image and a text the canvas rejects") {
        plx_layout_page page(600, 800);
        plx_layout_image broken(0, 0, 10, 10);
        broken.data = "definitely not an image";
        page.add_image(broken);
        page.add_image(plx_layout_image(0, 0, 10, 10));
        page.add_text(plx_layout_text("ok", 10, 10, 12));
        page.add_text(plx_layout_text("bad", 10, 30, 12));

        WHEN("The page is rendered") {
            recording_canvas canvas;
            canvas.fail_text = "bad";
            plx_layout_reconstructor reconstructor;
            size_t skipped = reconstructor.render_page(page, canvas);

            THEN("The failing elements are skipped, the rest is drawn") {
                REQUIRE(skipped == 3);
                REQUIRE(canvas.calls.size() == 1);
                REQUIRE(canvas.calls[0].content == "ok");
                REQUIRE(canvas.pages_ended == 1);
            }
        }
    }

    GIVEN("A text with no usable font size") {
        plx_layout_page page(600, 800, 90);
        plx_layout_text text("tiny", 0, 100, 0);
        page.add_text(text);

        THEN("The default size is used and the rotation is passed through") {
            recording_canvas canvas;
            plx_layout_reconstructor reconstructor(9);
            reconstructor.render_page(page, canvas);
            REQUIRE(canvas.calls.size() == 1);
            REQUIRE(canvas.calls[0].height == 9);
            REQUIRE(canvas.last_rotation == 90);
        }
    }
}

SCENARIO("Document level outcomes", "[reconstructor]") {
    GIVEN("No pages") {
        recording_canvas canvas;
        plx_layout_reconstructor reconstructor;

        THEN("The document is still produced") {
            REQUIRE(reconstructor.reconstruct({}, canvas) == "%PDF-fake");
            REQUIRE(canvas.pages_begun == 0);
        }
    }

    GIVEN("A canvas that cannot finish the document") {
        recording_canvas canvas;
        canvas.fail_finish = true;
        plx_layout_reconstructor reconstructor;

        THEN("A serialize stage processing error is raised") {
            try {
                reconstructor.reconstruct({plx_layout_page(100, 100)}, canvas);
                FAIL("expected plx_processing_error");
            } catch (const plx_processing_error& e) {
                REQUIRE(e.get_stage() == plx_processing_error::stage::serialize);
                REQUIRE(e.get_detail() == "disk full");
            }
        }
    }
}
