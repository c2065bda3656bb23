//=============================================================================
// LineBatch Tests
//
// Vertex layout, premultiplication, cursor bookkeeping and overflow flushing
//=============================================================================

#include <algorithm>
#include <cmath>
#include <string>

#include <boost/ut.hpp>
#include <inkwell/line-batch.h>

using namespace boost::ut;
using namespace inkwell;

suite line_batch_tests = [] {
    "new batch is empty"_test = [] {
        LineBatch batch(16);

        expect(batch.empty());
        expect(batch.segmentCapacity() == 16_u);
        expect(batch.segmentCount() == 0_u);
        expect(batch.vertexCount() == 0_u);
        expect(batch.lineColor().size() == 16u * 24u);
        expect(batch.lineThicknessAndLength().size() == 16u * 12u);
        expect(batch.penPoints().size() == 16u * 24u);
    };

    "default capacity matches 65520 color floats"_test = [] {
        LineBatch batch;

        expect(batch.segmentCapacity() == 2730_u);
        expect(batch.lineColor().size() == 65520_u);
        expect(batch.lineThicknessAndLength().size() == 32760_u);
        expect(batch.penPoints().size() == 65520_u);
        expect(batch.cornerTemplate().size() == 32760_u);
    };

    "one segment writes six vertices"_test = [] {
        LineBatch batch(4);
        PenAttributes attrs;
        attrs.diameter = 1.0f;
        attrs.color = Color4f{1.0f, 0.0f, 0.0f, 1.0f};

        auto res = batch.append(attrs, 0.0f, 0.0f, 100.0f, 0.0f);
        expect(res.has_value() >> fatal) << error_msg(res);

        expect(batch.segmentCount() == 1_u);
        expect(batch.vertexCount() == 6_u);
        expect(batch.colorCursor() == 24_u);
        expect(batch.thicknessCursor() == 12_u);
        expect(batch.pointsCursor() == 24_u);

        for (uint32_t v = 0; v < 6; v++) {
            const float* color = batch.lineColor().data() + v * 4;
            expect(color[0] == 1.0_f && color[1] == 0.0_f && color[2] == 0.0_f && color[3] == 1.0_f);
            const float* tl = batch.lineThicknessAndLength().data() + v * 2;
            expect(tl[0] == 1.0_f) << "thickness";
            expect(tl[1] == 100.0_f) << "length";
        }
    };

    "pen points store start and delta with y negated"_test = [] {
        LineBatch batch(4);
        expect(batch.append(PenAttributes{}, 10.0f, 20.0f, 13.0f, 24.0f).has_value() >> fatal);

        for (uint32_t v = 0; v < 6; v++) {
            const float* p = batch.penPoints().data() + v * 4;
            expect(p[0] == 10.0_f);
            expect(p[1] == -20.0_f);
            expect(p[2] == 3.0_f);
            expect(p[3] == -4.0_f);
        }
        expect(batch.lineThicknessAndLength()[1] == 5.0_f) << "3-4-5 length";
    };

    "color is premultiplied by alpha"_test = [] {
        LineBatch batch(4);
        PenAttributes attrs;
        attrs.color = Color4f{0.8f, 0.4f, 0.2f, 0.5f};

        expect(batch.append(attrs, 0, 0, 1, 1).has_value() >> fatal);

        const float* c = batch.lineColor().data();
        expect(std::abs(c[0] - 0.4f) < 1e-6f) << "r*a";
        expect(std::abs(c[1] - 0.2f) < 1e-6f) << "g*a";
        expect(std::abs(c[2] - 0.1f) < 1e-6f) << "b*a";
        expect(c[3] == 0.5_f) << "alpha kept";
    };

    "omitted attributes use defaults"_test = [] {
        LineBatch batch(4);
        expect(batch.append(PenAttributes{}, 0, 0, 0, 0).has_value() >> fatal);

        const float* c = batch.lineColor().data();
        expect(c[0] == 0.0_f && c[1] == 0.0_f && c[2] == 1.0_f && c[3] == 1.0_f) << "default blue";
        expect(batch.lineThicknessAndLength()[0] == 1.0_f) << "default diameter";
        expect(batch.lineThicknessAndLength()[1] == 0.0_f) << "zero length point";
    };

    "configured defaults apply to omitted attributes"_test = [] {
        PenDefaults defaults;
        defaults.diameter = 4.0f;
        defaults.color = Color4f{0.0f, 1.0f, 0.0f, 1.0f};
        LineBatch batch(4, defaults);

        PenAttributes attrs;
        attrs.diameter = 0.0f;  // counts as unset
        expect(batch.append(attrs, 0, 0, 1, 0).has_value() >> fatal);

        expect(batch.lineThicknessAndLength()[0] == 4.0_f);
        expect(batch.lineColor()[1] == 1.0_f);
    };

    "corner template repeats the unit quad"_test = [] {
        LineBatch batch(3);
        const float expected[12] = {1, 0, 0, 0, 1, 1, 1, 1, 0, 0, 0, 1};
        const auto& corners = batch.cornerTemplate();

        expect(corners.size() == 36_u);
        for (size_t i = 0; i < corners.size(); i++) {
            expect(corners[i] == expected[i % 12]) << "corner index " << i;
        }
    };

    "reset rewinds cursors"_test = [] {
        LineBatch batch(4);
        expect(batch.append(PenAttributes{}, 0, 0, 1, 1).has_value() >> fatal);
        batch.reset();

        expect(batch.empty());
        expect(batch.colorCursor() == 0_u);
        expect(batch.thicknessCursor() == 0_u);
        expect(batch.pointsCursor() == 0_u);
    };

    "no flush until capacity is reached"_test = [] {
        LineBatch batch(3);
        int flushes = 0;
        batch.setFlushHandler([&]() -> Result<void> {
            flushes++;
            batch.reset();
            return Ok();
        });

        for (int i = 0; i < 3; i++) {
            expect(batch.append(PenAttributes{}, 0, 0, 1, 1).has_value() >> fatal);
        }
        expect(flushes == 0_i);
        expect(batch.wouldOverflow());

        expect(batch.append(PenAttributes{}, 5, 5, 6, 6).has_value() >> fatal);
        expect(flushes == 1_i);
        expect(batch.segmentCount() == 1_u) << "record went into the fresh batch";
        expect(batch.penPoints()[0] == 5.0_f);
    };

    "overflow without handler is an error"_test = [] {
        LineBatch batch(1);
        expect(batch.append(PenAttributes{}, 0, 0, 1, 1).has_value() >> fatal);

        auto res = batch.append(PenAttributes{}, 0, 0, 1, 1);
        expect(!res.has_value());
        expect(batch.segmentCount() == 1_u) << "batch untouched";
    };

    "failing flush handler propagates"_test = [] {
        LineBatch batch(1);
        batch.setFlushHandler([]() -> Result<void> { return Err<void>("gpu lost"); });
        expect(batch.append(PenAttributes{}, 0, 0, 1, 1).has_value() >> fatal);

        auto res = batch.append(PenAttributes{}, 0, 0, 1, 1);
        expect(!res.has_value() >> fatal);
        expect(res.error().to_string().find("gpu lost") != std::string::npos);
    };

    "handler that leaves the batch full is an error"_test = [] {
        LineBatch batch(1);
        batch.setFlushHandler([]() -> Result<void> { return Ok(); });
        expect(batch.append(PenAttributes{}, 0, 0, 1, 1).has_value() >> fatal);

        expect(!batch.append(PenAttributes{}, 0, 0, 1, 1).has_value());
    };

    "partial upload below threshold"_test = [] {
        LineBatch batch(100);
        expect(batch.usePartialUpload(1000));

        for (int i = 0; i < 41; i++) {
            expect(batch.append(PenAttributes{}, 0, 0, 1, 1).has_value() >> fatal);
        }
        // 41 * 24 = 984 color floats
        expect(batch.usePartialUpload(1000));

        expect(batch.append(PenAttributes{}, 0, 0, 1, 1).has_value() >> fatal);
        // 1008 color floats
        expect(!batch.usePartialUpload(1000));
    };
};
