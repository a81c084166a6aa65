#include <catch2/catch_all.hpp>
#include "../documents/layout/plx_layout_coords.h"
#include <limits>

using Catch::Approx;

SCENARIO("Layout y and page y convert into each other", "[coords]") {
    GIVEN("An A4 page") {
        const double H = 841.89;

        WHEN("A baseline is converted to the layout frame and back") {
            THEN("The original page y is restored") {
                for (double y : {0.0, 12.5, 420.0, 841.89, -5.0, 900.0}) {
                    double canonical = plx_coords::to_canonical_y(y, H);
                    REQUIRE(plx_coords::from_canonical_y(canonical, H, 0.0) == Approx(y));
                }
            }
        }

        WHEN("A box of height 50 has its top edge at layout y 100") {
            double bottom = plx_coords::from_canonical_y(100.0, H, 50.0);

            THEN("Its bottom edge sits 150 points below the top of the page") {
                REQUIRE(bottom == Approx(H - 150.0));
                REQUIRE(plx_coords::to_canonical_top(bottom, 50.0, H) == Approx(100.0));
            }
        }
    }
}

SCENARIO("Transform matrices resolve to placements", "[coords]") {
    GIVEN("A page of height 800") {
        const double H = 800.0;

        WHEN("The matrix is a pure translation") {
            plx_placement p = plx_coords::matrix_to_origin({1, 0, 0, 1, 72, 700}, H);

            THEN("The position is taken from e and f") {
                REQUIRE_FALSE(p.degenerate);
                REQUIRE(p.x == Approx(72));
                REQUIRE(p.y == Approx(100));
                REQUIRE(p.scale_x == Approx(1));
                REQUIRE(p.scale_y == Approx(1));
            }
        }

        WHEN("The matrix scales and rotates") {
            // 90 degrees, scaled by 200 x 100
            plx_placement p = plx_coords::matrix_to_origin({0, 200, -100, 0, 10, 20}, H);

            THEN("The scales are the lengths of the column vectors") {
                REQUIRE(p.scale_x == Approx(200));
                REQUIRE(p.scale_y == Approx(100));
                REQUIRE(p.x == Approx(10));
                REQUIRE(p.y == Approx(780));
            }
        }

        WHEN("The matrix has a zero scale") {
            plx_placement p = plx_coords::matrix_to_origin({0, 0, 0, 1, 300, 300}, H);

            THEN("The fallback placement is used") {
                REQUIRE(p.degenerate);
                REQUIRE(p.x == 0);
                REQUIRE(p.y == 0);
                REQUIRE(p.scale_x == 1);
                REQUIRE(p.scale_y == 1);
            }
        }

        WHEN("The matrix contains NaN") {
            const double nan = std::numeric_limits<double>::quiet_NaN();
            plx_placement p = plx_coords::matrix_to_origin({1, 0, 0, 1, nan, 5}, H);

            THEN("The fallback placement is used") {
                REQUIRE(p.degenerate);
                REQUIRE(p.x == 0);
                REQUIRE(p.y == 0);
            }
        }
    }
}

SCENARIO("Images are placed by the box their unit square covers", "[coords]") {
    const double H = 792.0;

    GIVEN("An upright transform") {
        plx_placement p = plx_coords::unit_square_to_origin({100, 0, 0, 50, 10, 600}, H);
        THEN("The top edge is f + d") {
            REQUIRE(p.x == Approx(10));
            REQUIRE(p.y == Approx(H - 650));
        }
    }

    GIVEN("A vertically flipped transform") {
        plx_placement p = plx_coords::unit_square_to_origin({100, 0, 0, -50, 10, 650}, H);
        THEN("The square hangs below f, so the top edge is f") {
            REQUIRE(p.x == Approx(10));
            REQUIRE(p.y == Approx(H - 650));
            REQUIRE(p.scale_x == Approx(100));
            REQUIRE(p.scale_y == Approx(50));
            REQUIRE(plx_coords::from_canonical_y(p.y, H, p.scale_y) == Approx(600));
        }
    }

    GIVEN("A quarter turn") {
        plx_placement p = plx_coords::unit_square_to_origin({0, 200, -100, 0, 300, 100}, H);
        THEN("The left edge moves by c and the top edge by b") {
            REQUIRE(p.x == Approx(200));
            REQUIRE(p.y == Approx(H - 300));
        }
    }

    GIVEN("A collapsed transform") {
        THEN("The fallback is kept") {
            REQUIRE(plx_coords::unit_square_to_origin({0, 0, 0, 0, 5, 5}, H).degenerate);
        }
    }
}

SCENARIO("Matrices concatenate in content stream order", "[coords]") {
    GIVEN("A scale followed by a translation") {
        plx_matrix scale{2, 0, 0, 3, 0, 0};
        plx_matrix move{1, 0, 0, 1, 10, 20};

        THEN("Scaling first keeps the translation unscaled") {
            plx_matrix m = plx_coords::multiply(scale, move);
            REQUIRE(m[0] == Approx(2));
            REQUIRE(m[3] == Approx(3));
            REQUIRE(m[4] == Approx(10));
            REQUIRE(m[5] == Approx(20));
        }

        THEN("Translating first scales the translation") {
            plx_matrix m = plx_coords::multiply(move, scale);
            REQUIRE(m[4] == Approx(20));
            REQUIRE(m[5] == Approx(60));
        }

        THEN("The identity is neutral") {
            plx_matrix m = plx_coords::multiply(plx_identity_matrix(), move);
            REQUIRE(m == move);
        }
    }
}
