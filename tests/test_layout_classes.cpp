#include <catch2/catch_all.hpp>
#include "../documents/layout/plx_layout_page.h"

SCENARIO("Elements share position and footprint through plx_layout_bounds") {
    GIVEN("A text and an image") {
        plx_layout_text text("label", 10, 20, 14);
        plx_layout_image image(30, 40, 100, 50);

        THEN("Text height defaults to its font size and y is the baseline") {
            REQUIRE(text.x == 10);
            REQUIRE(text.y == 20);
            REQUIRE(text.width == 0);
            REQUIRE(text.height == 14);
        }

        THEN("Image y is the top edge of its footprint") {
            REQUIRE(image.x == 30);
            REQUIRE(image.y == 40);
            REQUIRE(image.width == 100);
            REQUIRE(image.height == 50);
        }
    }
}

SCENARIO("plx_layout_page keeps texts and images in one ordered list") {
    GIVEN("A page with mixed elements") {
        plx_layout_page page(595, 842);
        page.add_text(plx_layout_text("Header", 50, 60, 18));
        page.add_image(plx_layout_image(50, 100, 200, 100));
        page.add_text(plx_layout_text("Body", 50, 240, 11));

        THEN("Counts are per kind") {
            REQUIRE(page.elements.size() == 3);
            REQUIRE(page.text_count() == 2);
            REQUIRE(page.image_count() == 1);
        }

        THEN("Element order is insertion order") {
            REQUIRE(plx_is_text(page.elements[0]));
            REQUIRE(plx_is_image(page.elements[1]));
            REQUIRE(plx_is_text(page.elements[2]));
        }

        THEN("texts() skips images") {
            auto texts = page.texts();
            REQUIRE(texts.size() == 2);
            REQUIRE(texts[0]->text == "Header");
            REQUIRE(texts[1]->text == "Body");
            REQUIRE(texts[1]->font_size == 11);
            REQUIRE(texts[1]->height == 11);
        }
    }

    GIVEN("A text element built without arguments") {
        plx_layout_text text;

        THEN("It is black 12pt text") {
            REQUIRE(text.font_size == 12);
            REQUIRE(text.color == plx_color());
            REQUIRE(text.text.empty());
        }
    }
}

SCENARIO("Page rotation is kept to quarter turns") {
    REQUIRE(plx_normalize_rotation(0) == 0);
    REQUIRE(plx_normalize_rotation(90) == 90);
    REQUIRE(plx_normalize_rotation(270) == 270);
    REQUIRE(plx_normalize_rotation(360) == 0);
    REQUIRE(plx_normalize_rotation(450) == 90);
    REQUIRE(plx_normalize_rotation(-90) == 270);
    REQUIRE(plx_normalize_rotation(100) == 90);

    plx_layout_page page(100, 100, -180);
    REQUIRE(page.rotation == 180);
}
