//=============================================================================
// ZOrderManager Tests
//
// Layer registration, stacking, reordering with history, collisions and
// groups.
//=============================================================================

#include <boost/ut.hpp>
#include <retext/z-order-manager.h>

#include <string>
#include <vector>

using namespace boost::ut;
using namespace retext;

namespace {

std::vector<std::string> stackIds(const ZOrderManager& zm, int page) {
    std::vector<std::string> ids;
    for (const auto& l : zm.pageLayers(page)) ids.push_back(l.id);
    return ids;
}

std::vector<int> stackZ(const ZOrderManager& zm, int page) {
    std::vector<int> zs;
    for (const auto& l : zm.pageLayers(page)) zs.push_back(l.zOrder);
    return zs;
}

std::string add(ZOrderManager& zm, int page, Rect bbox, LayerLevel level = LayerLevel::Text) {
    auto res = zm.addLayer(page, bbox, level);
    return res ? res->id : std::string();
}

} // namespace

suite z_order_layer_tests = [] {
    "layers get increasing z within a level"_test = [] {
        ZOrderManager zm;
        auto a = zm.addLayer(0, {0, 0, 10, 10});
        auto b = zm.addLayer(0, {0, 0, 10, 10});
        expect((a.has_value() && b.has_value()) >> fatal);
        expect(a->zOrder == 400_i);
        expect(b->zOrder == 410_i);
        expect(a->id != b->id);
        expect(a->name == "Layer_" + a->id);
        expect(zm.layerCount() == 2_u);
    };

    "level order beats insertion order"_test = [] {
        ZOrderManager zm;
        auto text = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Text);
        auto redaction = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Redaction);
        auto highlight = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Highlight);
        auto ids = stackIds(zm, 0);
        expect((ids.size() == 3_u) >> fatal);
        expect(ids[0] == redaction);
        expect(ids[1] == text);
        expect(ids[2] == highlight);
    };

    "pages are independent"_test = [] {
        ZOrderManager zm;
        add(zm, 0, {0, 0, 10, 10});
        auto other = zm.addLayer(3, {0, 0, 10, 10});
        expect(other.has_value() >> fatal);
        expect(other->zOrder == 400_i);
        expect(zm.pageCount() == 2_u);
        expect(zm.pageLayers(1).empty());
    };

    "page layer limit is enforced"_test = [] {
        ZOrderConfig config;
        config.maxLayersPerPage = 2;
        ZOrderManager zm(config);
        add(zm, 0, {0, 0, 1, 1});
        add(zm, 0, {0, 0, 1, 1});
        auto third = zm.addLayer(0, {0, 0, 1, 1});
        expect(!third.has_value());
        expect(error_msg(third).find("layer limit") != std::string::npos);
        expect(zm.addLayer(1, {0, 0, 1, 1}).has_value());
    };

    "filters by level and visibility"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Text);
        add(zm, 0, {0, 0, 10, 10}, LayerLevel::Redaction);
        expect(zm.pageLayers(0, LayerLevel::Text).size() == 1_u);

        expect(zm.setVisible(a, false));
        expect(zm.pageLayers(0, std::nullopt, true).size() == 1_u);
        expect(zm.pageLayers(0).size() == 2_u);
        expect(!zm.setVisible("layer-999", true));
    };

    "layersAtPoint returns topmost first"_test = [] {
        ZOrderManager zm;
        auto low = add(zm, 0, {0, 0, 100, 100}, LayerLevel::Fill);
        auto high = add(zm, 0, {50, 50, 150, 150}, LayerLevel::Annotation);
        auto hits = zm.layersAtPoint(0, 75, 75);
        expect((hits.size() == 2_u) >> fatal);
        expect(hits[0].id == high);
        expect(hits[1].id == low);
        expect(zm.layersAtPoint(0, 10, 10).size() == 1_u);
        expect(zm.layersAtPoint(0, 500, 500).empty());
    };

    "locked layers cannot be moved or removed"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        add(zm, 0, {0, 0, 10, 10});
        expect(zm.setLocked(a, true));
        expect(!zm.bringToFront(a));
        expect(!zm.removeLayer(a));
        expect(zm.setLocked(a, false));
        expect(zm.removeLayer(a));
        expect(zm.layer(a) == nullptr);
    };

    "level helpers"_test = [] {
        expect(levelFromZ(405) == LayerLevel::Text);
        expect(levelFromZ(100) == LayerLevel::Redaction);
        expect(levelFromZ(-5) == LayerLevel::Background);
        expect(levelForSourceType("Underline") == LayerLevel::TextDecoration);
        expect(levelForSourceType("erase") == LayerLevel::Redaction);
        expect(levelForSourceType("whatever") == LayerLevel::Text);
    };
};

suite z_order_reorder_tests = [] {
    "alternating bring to front stays inside the level"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        add(zm, 0, {0, 0, 10, 10}, LayerLevel::TextDecoration);

        for (int i = 0; i < 20; i++) {
            const auto& id = (i % 2 == 0) ? a : b;
            expect(zm.bringToFront(id) >> fatal);
            auto text = zm.pageLayers(0, LayerLevel::Text);
            expect((text.size() == 2_u) >> fatal);
            expect(text.back().id == id) << "round" << i;
            expect(text.front().zOrder < text.back().zOrder) << "round" << i;
            expect(text.back().zOrder < levelBase(LayerLevel::TextDecoration)) << "round" << i;
            expect(levelFromZ(zm.layer(id)->zOrder) == LayerLevel::Text);
        }
        expect(stackIds(zm, 0).back() != a && stackIds(zm, 0).back() != b);
    };

    "redactions brought to front stay under the text level"_test = [] {
        ZOrderManager zm;
        auto r1 = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Redaction);
        auto t1 = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Text);
        auto r2 = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Redaction);
        auto t2 = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Text);

        for (int i = 0; i < 40; i++) expect(zm.bringToFront(i % 2 == 0 ? r1 : r2) >> fatal);

        for (const auto& l : zm.pageLayers(0, LayerLevel::Redaction)) {
            expect(l.zOrder >= levelBase(LayerLevel::Redaction));
            expect(l.zOrder < levelBase(LayerLevel::ContentBase)) << l.id << "z" << l.zOrder;
        }
        expect(zm.layer(r1)->zOrder < zm.layer(t1)->zOrder);
        expect(zm.layer(r2)->zOrder < zm.layer(t2)->zOrder);
        // r2 went to the front last
        expect(zm.layer(r1)->zOrder < zm.layer(r2)->zOrder);
    };

    "undo restores a renumbered level"_test = [] {
        ZOrderManager zm;
        std::vector<std::string> ids;
        for (int i = 0; i < 5; i++) ids.push_back(add(zm, 0, {0, 0, 10, 10}));
        auto before = stackZ(zm, 0);
        // 440 + 10 reaches TextDecoration: the level is renumbered instead
        expect(zm.bringToFront(ids[0]));
        expect(stackIds(zm, 0).back() == ids[0]);
        expect(stackZ(zm, 0).back() < levelBase(LayerLevel::TextDecoration));
        expect(zm.undo());
        expect(stackZ(zm, 0) == before);
        expect(stackIds(zm, 0) == ids);
    };

    "adding past the level range renumbers it"_test = [] {
        ZOrderManager zm;
        std::vector<std::string> ids;
        for (int i = 0; i < 8; i++) ids.push_back(add(zm, 0, {0, 0, 10, 10}));
        expect(stackIds(zm, 0) == ids);
        auto zs = stackZ(zm, 0);
        for (size_t i = 0; i < zs.size(); i++) {
            expect(zs[i] >= levelBase(LayerLevel::Text));
            expect(zs[i] < levelBase(LayerLevel::TextDecoration));
            if (i > 0) expect(zs[i - 1] < zs[i]);
        }
    };

    "bring to front of the top layer is a no-op"_test = [] {
        ZOrderManager zm;
        add(zm, 0, {0, 0, 10, 10});
        auto top = add(zm, 0, {0, 0, 10, 10});
        expect(zm.bringToFront(top));
        expect(zm.layer(top)->zOrder == 410_i);
        expect(!zm.canUndo());
    };

    "send to back lifts the level when there is no room below"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        auto c = add(zm, 0, {0, 0, 10, 10});
        expect(zm.sendToBack(c));
        auto ids = stackIds(zm, 0);
        expect((ids.size() == 3_u) >> fatal);
        expect(ids[0] == c);
        expect(ids[1] == a);
        expect(ids[2] == b);
        auto zs = stackZ(zm, 0);
        expect(zs[0] < zs[1] && zs[1] < zs[2]);
        expect(zs[0] >= levelBase(LayerLevel::Text));
    };

    "forward and backward swap with the neighbour"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        expect(zm.bringForward(a));
        expect(stackIds(zm, 0) == std::vector<std::string>{b, a});
        expect(zm.sendBackward(a));
        expect(stackIds(zm, 0) == std::vector<std::string>{a, b});
    };

    "bring forward passes a layer added after a front move"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        expect(zm.bringToFront(a));
        auto c = add(zm, 0, {0, 0, 10, 10});
        expect(zm.layer(c)->zOrder > zm.layer(a)->zOrder);

        expect(zm.bringForward(a));
        expect(stackIds(zm, 0) == std::vector<std::string>{b, c, a});
        expect(zm.layer(a)->zOrder > zm.layer(c)->zOrder);
    };

    "forward breaks a z tie"_test = [] {
        ZOrderConfig config;
        config.maintainLevelBoundaries = false;
        ZOrderManager zm(config);
        auto text = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Text);
        std::string fill;
        // The eleventh fill layer lands on z 400, level with the text
        for (int i = 0; i < 11; i++) fill = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Fill);
        expect((zm.layer(fill)->zOrder == zm.layer(text)->zOrder) >> fatal);
        expect(stackIds(zm, 0).back() == fill);

        expect(zm.bringForward(text));
        expect(stackIds(zm, 0).back() == text);
        expect(zm.layer(text)->zOrder > zm.layer(fill)->zOrder);
        expect(zm.canUndo());

        expect(zm.sendBackward(text));
        expect(stackIds(zm, 0).back() == fill);
        expect(zm.layer(text)->zOrder < zm.layer(fill)->zOrder);
    };

    "reordering stays inside the level"_test = [] {
        ZOrderManager zm;
        auto redaction = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Redaction);
        add(zm, 0, {0, 0, 10, 10}, LayerLevel::Text);
        expect(zm.bringToFront(redaction));
        expect(stackIds(zm, 0).front() == redaction);
    };

    "moveToLevel needs cross level movement"_test = [] {
        ZOrderManager locked;
        auto id = add(locked, 0, {0, 0, 10, 10});
        expect(!locked.moveToLevel(id, LayerLevel::Annotation));

        ZOrderConfig config;
        config.allowCrossLevelMovement = true;
        ZOrderManager zm(config);
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        expect(zm.moveToLevel(a, LayerLevel::Annotation));
        expect(zm.layer(a)->level == LayerLevel::Annotation);
        expect(zm.layer(a)->zOrder == 600_i);
        expect(stackIds(zm, 0) == std::vector<std::string>{b, a});

        expect(zm.undo());
        expect(zm.layer(a)->level == LayerLevel::Text);
        expect(zm.layer(a)->zOrder == 400_i);
    };

    "swap exchanges z on the same page only"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        auto other = add(zm, 1, {0, 0, 10, 10});
        expect(zm.swapLayers(a, b));
        expect(zm.layer(a)->zOrder == 410_i);
        expect(zm.layer(b)->zOrder == 400_i);
        expect(!zm.swapLayers(a, other));
        expect(!zm.swapLayers(a, a));
    };

    "resolveConflict puts the preferred layer on top"_test = [] {
        ZOrderManager zm;
        auto older = add(zm, 0, {0, 0, 10, 10});
        auto newer = add(zm, 0, {0, 0, 10, 10});
        expect(zm.resolveConflict(older, newer) == newer);
        expect(zm.layer(newer)->zOrder == 410_i);

        expect(zm.resolveConflict(older, newer, false) == older);
        expect(zm.layer(older)->zOrder > zm.layer(newer)->zOrder);

        expect(zm.resolveConflict(older, "layer-404") == older);
        expect(zm.resolveConflict("x", "y").empty());
    };
};

suite z_order_history_tests = [] {
    "N undos restore and N redos replay"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        auto c = add(zm, 0, {0, 0, 10, 10});

        auto initial = stackZ(zm, 0);
        auto initialIds = stackIds(zm, 0);

        expect(zm.bringToFront(a));
        expect(zm.sendToBack(c));
        expect(zm.bringForward(b));
        expect(zm.swapLayers(a, c));
        auto final = stackZ(zm, 0);
        auto finalIds = stackIds(zm, 0);

        for (int i = 0; i < 4; i++) expect(zm.undo() >> fatal);
        expect(!zm.canUndo());
        expect(stackZ(zm, 0) == initial);
        expect(stackIds(zm, 0) == initialIds);

        for (int i = 0; i < 4; i++) expect(zm.redo() >> fatal);
        expect(!zm.canRedo());
        expect(stackZ(zm, 0) == final);
        expect(stackIds(zm, 0) == finalIds);
    };

    "a new action drops the redo branch"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        expect(zm.bringToFront(a));
        expect(zm.undo());
        expect(zm.canRedo());
        expect(zm.bringToFront(a));
        expect(!zm.canRedo());
        expect(zm.history().size() == 1_u);
        (void)b;
    };

    "history is bounded"_test = [] {
        ZOrderConfig config;
        config.maxHistory = 3;
        ZOrderManager zm(config);
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        for (int i = 0; i < 6; i++) zm.bringToFront(i % 2 == 0 ? a : b);
        expect(zm.history().size() == 3_u);
        int undone = 0;
        while (zm.undo()) undone++;
        expect(undone == 3_i);
    };

    "clearHistory forgets undo and redo"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        expect(zm.bringToFront(a));
        expect(zm.bringToFront(b));
        expect(zm.undo());
        zm.clearHistory();
        expect(zm.history().empty());
        expect(!zm.canUndo());
        expect(!zm.canRedo());
        expect(!zm.undo());
    };

    "disabled history records nothing"_test = [] {
        ZOrderConfig config;
        config.enableHistory = false;
        ZOrderManager zm(config);
        auto a = add(zm, 0, {0, 0, 10, 10});
        add(zm, 0, {0, 0, 10, 10});
        expect(zm.bringToFront(a));
        expect(!zm.canUndo());
        expect(!zm.undo());
    };

    "undo skips layers removed since"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        expect(zm.bringForward(a));
        expect(zm.removeLayer(b));
        expect(zm.undo());
        expect(zm.layer(a)->zOrder == 400_i);
    };
};

suite z_order_collision_tests = [] {
    "collision detection is symmetric"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 100, 100});
        auto b = add(zm, 0, {50, 50, 150, 150});
        auto ab = zm.detectCollision(a, b);
        auto ba = zm.detectCollision(b, a);
        expect(ab.type == CollisionType::Partial);
        expect(ab.type == ba.type);
        expect(std::abs(ab.overlapArea - ba.overlapArea) < 1e-9);
        expect(std::abs(ab.overlapPercentage - 25.0) < 1e-9);
    };

    "identical boxes"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {10, 10, 60, 30});
        auto b = add(zm, 0, {10.2, 10, 60, 30.1});
        expect(zm.detectCollision(a, b).type == CollisionType::Identical);
    };

    "contained and mostly covered boxes"_test = [] {
        ZOrderManager zm;
        auto big = add(zm, 0, {0, 0, 100, 100});
        auto inner = add(zm, 0, {10, 10, 20, 20});
        auto wide = add(zm, 0, {0, 0, 100, 60});
        auto half = add(zm, 0, {0, 40, 100, 100});
        expect(zm.detectCollision(big, inner).type == CollisionType::Contains);
        // 20 of 60 rows shared
        expect(zm.detectCollision(wide, half).type == CollisionType::Partial);
        expect(zm.detectCollision(big, wide).type == CollisionType::Contains);
    };

    "disjoint boxes do not collide"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {200, 200, 210, 210});
        expect(!zm.detectCollision(a, b).isCollision());
        expect(!zm.hasCollision(a));
        expect(!zm.detectCollision(a, "layer-404").isCollision());
    };

    "page scan reports every colliding pair once"_test = [] {
        ZOrderManager zm;
        add(zm, 0, {0, 0, 100, 100});
        add(zm, 0, {50, 50, 150, 150});
        add(zm, 0, {90, 90, 120, 120});
        add(zm, 0, {500, 500, 510, 510});
        expect(zm.detectCollisions(0).size() == 3_u);
    };
};

suite z_order_group_tests = [] {
    "group keeps known layers only"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        auto group = zm.createGroup("pair", {a, b, "layer-404", a});
        expect(group.has_value() >> fatal);
        expect(group->count() == 2_u);
        expect(zm.layerGroup(a) != nullptr);
        expect(!zm.createGroup("none", {"layer-404"}).has_value());
    };

    "removing a layer removes it from its group"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        auto group = zm.createGroup("pair", {a, b});
        expect(group.has_value() >> fatal);
        expect(zm.removeLayer(a));
        const auto* g = zm.group(group->id);
        expect((g != nullptr) >> fatal);
        expect(!g->contains(a));
        expect(g->count() == 1_u);
    };

    "moving a layer into a new group leaves the old one"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto first = zm.createGroup("first", {a});
        auto second = zm.createGroup("second", {a});
        expect((first.has_value() && second.has_value()) >> fatal);
        expect(zm.group(first->id)->count() == 0_u);
        expect(zm.layerGroup(a)->id == second->id);
    };

    "group move is one undo step"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        auto b = add(zm, 0, {0, 0, 10, 10});
        auto c = add(zm, 0, {0, 0, 10, 10});
        auto group = zm.createGroup("ab", {a, b});
        expect(group.has_value() >> fatal);
        auto before = stackZ(zm, 0);

        expect(zm.moveGroup(group->id, ReorderOperation::ToFront));
        expect(stackIds(zm, 0).front() == c);
        expect(zm.history().size() == 1_u);

        expect(zm.undo());
        expect(stackZ(zm, 0) == before);
    };

    "locked groups do not move and dissolve clears membership"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10});
        add(zm, 0, {0, 0, 10, 10});
        auto group = zm.createGroup("g", {a});
        expect(group.has_value() >> fatal);
        expect(zm.setGroupLocked(group->id, true));
        expect(!zm.moveGroup(group->id, ReorderOperation::ToFront));
        expect(zm.dissolveGroup(group->id));
        expect(zm.layerGroup(a) == nullptr);
        expect(!zm.dissolveGroup(group->id));
    };
};

suite z_order_misc_tests = [] {
    "statistics and layer stack"_test = [] {
        ZOrderManager zm;
        auto a = add(zm, 0, {0, 0, 10, 10}, LayerLevel::Redaction);
        add(zm, 0, {0, 0, 10, 10}, LayerLevel::Text);
        add(zm, 2, {0, 0, 10, 10}, LayerLevel::Text);
        zm.createGroup("g", {a});

        auto stats = zm.statistics();
        expect(stats.totalLayers == 3_u);
        expect(stats.totalPages == 2_u);
        expect(stats.totalGroups == 1_u);
        expect(stats.layersByLevel[LayerLevel::Text] == 2_u);
        expect(stats.layersByPage[0] == 2_u);

        auto stack = zm.layerStack(0);
        expect((stack.size() == 2_u) >> fatal);
        expect(stack[0].level == LayerLevel::Redaction);
        expect(stack[0].zOrder == 100_i);
    };

    "clear resets counters"_test = [] {
        ZOrderManager zm;
        add(zm, 0, {0, 0, 10, 10});
        add(zm, 0, {0, 0, 10, 10});
        zm.clear();
        expect(zm.layerCount() == 0_u);
        auto again = zm.addLayer(0, {0, 0, 10, 10});
        expect(again.has_value() >> fatal);
        expect(again->zOrder == 400_i);
    };
};
