#include <retext/z-order-manager.h>
#include <retext/config.h>

#include <ytrace/ytrace.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace retext {

namespace {

constexpr std::array<LayerLevel, 14> kLevels = {
    LayerLevel::Background, LayerLevel::Redaction, LayerLevel::ContentBase,
    LayerLevel::Fill, LayerLevel::Stroke, LayerLevel::TextBackground,
    LayerLevel::Text, LayerLevel::TextDecoration, LayerLevel::Highlight,
    LayerLevel::Annotation, LayerLevel::Markup, LayerLevel::Foreground,
    LayerLevel::Overlay, LayerLevel::UI,
};

// First z past the level's range; UI gets the same width as Overlay
int levelCeiling(LayerLevel level) {
    for (LayerLevel next : kLevels) {
        if (levelBase(next) > levelBase(level)) return levelBase(next);
    }
    return levelBase(level) + (levelBase(LayerLevel::UI) - levelBase(LayerLevel::Overlay));
}

} // namespace

const char* toString(LayerLevel level) {
    switch (level) {
        case LayerLevel::Background:     return "BACKGROUND";
        case LayerLevel::Redaction:      return "REDACTION";
        case LayerLevel::ContentBase:    return "CONTENT_BASE";
        case LayerLevel::Fill:           return "FILL";
        case LayerLevel::Stroke:         return "STROKE";
        case LayerLevel::TextBackground: return "TEXT_BACKGROUND";
        case LayerLevel::Text:           return "TEXT";
        case LayerLevel::TextDecoration: return "TEXT_DECORATION";
        case LayerLevel::Highlight:      return "HIGHLIGHT";
        case LayerLevel::Annotation:     return "ANNOTATION";
        case LayerLevel::Markup:         return "MARKUP";
        case LayerLevel::Foreground:     return "FOREGROUND";
        case LayerLevel::Overlay:        return "OVERLAY";
        case LayerLevel::UI:             return "UI";
    }
    return "TEXT";
}

const char* toString(CollisionType type) {
    switch (type) {
        case CollisionType::None:      return "NONE";
        case CollisionType::Partial:   return "PARTIAL";
        case CollisionType::Full:      return "FULL";
        case CollisionType::Contains:  return "CONTAINS";
        case CollisionType::Identical: return "IDENTICAL";
    }
    return "NONE";
}

const char* toString(ReorderOperation op) {
    switch (op) {
        case ReorderOperation::ToFront:  return "TO_FRONT";
        case ReorderOperation::ToBack:   return "TO_BACK";
        case ReorderOperation::Forward:  return "FORWARD";
        case ReorderOperation::Backward: return "BACKWARD";
        case ReorderOperation::ToLevel:  return "TO_LEVEL";
        case ReorderOperation::Swap:     return "SWAP";
    }
    return "FORWARD";
}

LayerLevel levelFromZ(int z) {
    LayerLevel found = LayerLevel::Background;
    for (LayerLevel level : kLevels) {
        if (z >= levelBase(level)) found = level;
    }
    return found;
}

LayerLevel levelForSourceType(std::string_view sourceType) {
    std::string key;
    for (char c : sourceType) {
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    static const std::map<std::string, LayerLevel, std::less<>> mapping = {
        {"background", LayerLevel::Background},
        {"redaction", LayerLevel::Redaction},
        {"erase", LayerLevel::Redaction},
        {"fill", LayerLevel::Fill},
        {"text_background", LayerLevel::TextBackground},
        {"text", LayerLevel::Text},
        {"overlay", LayerLevel::Text},
        {"underline", LayerLevel::TextDecoration},
        {"strikethrough", LayerLevel::TextDecoration},
        {"highlight", LayerLevel::Highlight},
        {"annotation", LayerLevel::Annotation},
        {"note", LayerLevel::Annotation},
        {"comment", LayerLevel::Annotation},
        {"markup", LayerLevel::Markup},
        {"selection", LayerLevel::UI},
        {"cursor", LayerLevel::UI},
    };

    auto it = mapping.find(key);
    return it != mapping.end() ? it->second : LayerLevel::Text;
}

bool LayerGroup::contains(const std::string& layerId) const {
    return std::find(layerIds.begin(), layerIds.end(), layerId) != layerIds.end();
}

ZOrderConfig ZOrderConfig::fromConfig(const Config& config) {
    ZOrderConfig c;
    c.maintainLevelBoundaries = config.get<bool>("zorder.maintain-level-boundaries", c.maintainLevelBoundaries);
    c.allowCrossLevelMovement = config.get<bool>("zorder.allow-cross-level-movement", c.allowCrossLevelMovement);
    c.maxLayersPerPage = config.get<size_t>("zorder.max-layers-per-page", c.maxLayersPerPage);
    c.zOrderStep = config.get<int>("zorder.z-order-step", c.zOrderStep);
    c.enableHistory = config.get<bool>("zorder.enable-history", c.enableHistory);
    c.maxHistory = config.get<size_t>("zorder.max-history", c.maxHistory);
    c.collisionTolerance = config.get<double>("zorder.collision-tolerance", c.collisionTolerance);
    if (c.zOrderStep <= 0) {
        ywarn("zorder.z-order-step must be positive, got {}; using 10", c.zOrderStep);
        c.zOrderStep = 10;
    }
    return c;
}

//=============================================================================
// ZOrderManager
//=============================================================================

ZOrderManager::ZOrderManager(ZOrderConfig config) : _config(std::move(config)) {}

LayerInfo* ZOrderManager::findLayer(const std::string& layerId) {
    auto it = _layers.find(layerId);
    return it != _layers.end() ? &it->second : nullptr;
}

const LayerInfo* ZOrderManager::layer(const std::string& layerId) const {
    auto it = _layers.find(layerId);
    return it != _layers.end() ? &it->second : nullptr;
}

int ZOrderManager::nextZOrder(int page, LayerLevel level) {
    int& counter = _zCounters[{page, level}];
    int z = levelBase(level) + counter * _config.zOrderStep;

    // Stay above anything a reorder already pushed past the counter
    auto it = _pageLayers.find(page);
    if (it != _pageLayers.end()) {
        for (const auto& id : it->second) {
            const LayerInfo& other = _layers.at(id);
            if (other.level == level) z = std::max(z, other.zOrder + _config.zOrderStep);
        }
    }

    counter = (z - levelBase(level)) / _config.zOrderStep + 1;
    return z;
}

bool ZOrderManager::orderedBefore(const LayerInfo& a, const LayerInfo& b) const {
    if (_config.maintainLevelBoundaries && a.level != b.level) {
        return levelBase(a.level) < levelBase(b.level);
    }
    if (a.zOrder != b.zOrder) return a.zOrder < b.zOrder;
    return a.sequence < b.sequence;
}

void ZOrderManager::sortPage(int page) {
    auto it = _pageLayers.find(page);
    if (it == _pageLayers.end()) return;
    std::stable_sort(it->second.begin(), it->second.end(),
                     [this](const std::string& a, const std::string& b) {
                         return orderedBefore(_layers.at(a), _layers.at(b));
                     });
}

Result<LayerInfo> ZOrderManager::addLayer(int page, const Rect& bbox, LayerLevel level,
                                          const std::string& name, const std::string& sourceType,
                                          const std::string& sourceId) {
    auto existing = _pageLayers.find(page);
    size_t count = existing != _pageLayers.end() ? existing->second.size() : 0;
    if (count >= _config.maxLayersPerPage) {
        return Err<LayerInfo>(fmt::format("layer limit reached on page {} ({})",
                                          page, _config.maxLayersPerPage));
    }

    LayerInfo info;
    info.id = fmt::format("layer-{}", _nextLayerId++);
    info.name = name.empty() ? fmt::format("Layer_{}", info.id) : name;
    info.page = page;
    info.level = level;
    info.zOrder = nextZOrder(page, level);
    info.bbox = bbox;
    info.createdAt = std::chrono::system_clock::now();
    info.modifiedAt = info.createdAt;
    info.sourceType = sourceType;
    info.sourceId = sourceId;
    info.sequence = _nextSequence++;

    _layers.emplace(info.id, info);
    auto& ids = _pageLayers[page];

    // Insert before the first layer that sorts after it
    auto pos = std::find_if(ids.begin(), ids.end(), [&](const std::string& other) {
        return orderedBefore(info, _layers.at(other));
    });
    ids.insert(pos, info.id);

    if (_config.maintainLevelBoundaries && info.zOrder >= levelCeiling(level)) {
        // Level range is full: renumber it, the new layer stays on top
        std::vector<LayerChange> renumbered;
        restack(siblingsOf(info), renumbered);
        sortPage(page);
        info = _layers.at(info.id);
    }

    ytrace("addLayer {} page={} level={} z={}", info.id, page, toString(level), info.zOrder);
    return Ok(std::move(info));
}

bool ZOrderManager::removeLayer(const std::string& layerId) {
    LayerInfo* info = findLayer(layerId);
    if (!info) return false;
    if (info->locked) {
        ywarn("Cannot remove locked layer {}", layerId);
        return false;
    }

    if (info->groupId) {
        auto git = _groups.find(*info->groupId);
        if (git != _groups.end()) {
            auto& members = git->second.layerIds;
            members.erase(std::remove(members.begin(), members.end(), layerId), members.end());
        }
    }

    auto pit = _pageLayers.find(info->page);
    if (pit != _pageLayers.end()) {
        auto& ids = pit->second;
        ids.erase(std::remove(ids.begin(), ids.end(), layerId), ids.end());
        if (ids.empty()) _pageLayers.erase(pit);
    }

    _layers.erase(layerId);
    return true;
}

std::vector<LayerInfo> ZOrderManager::pageLayers(int page, std::optional<LayerLevel> level,
                                                 bool visibleOnly) const {
    std::vector<LayerInfo> out;
    auto it = _pageLayers.find(page);
    if (it == _pageLayers.end()) return out;

    for (const auto& id : it->second) {
        const LayerInfo& info = _layers.at(id);
        if (visibleOnly && !info.visible) continue;
        if (level && info.level != *level) continue;
        out.push_back(info);
    }
    return out;
}

std::vector<LayerInfo> ZOrderManager::allLayers() const {
    std::vector<LayerInfo> out;
    out.reserve(_layers.size());
    for (const auto& [page, ids] : _pageLayers) {
        for (const auto& id : ids) out.push_back(_layers.at(id));
    }
    return out;
}

std::vector<LayerInfo> ZOrderManager::layersAtPoint(int page, double x, double y, bool visibleOnly) const {
    std::vector<LayerInfo> out;
    auto it = _pageLayers.find(page);
    if (it == _pageLayers.end()) return out;

    for (auto rit = it->second.rbegin(); rit != it->second.rend(); ++rit) {
        const LayerInfo& info = _layers.at(*rit);
        if (visibleOnly && !info.visible) continue;
        if (info.containsPoint(x, y)) out.push_back(info);
    }
    return out;
}

bool ZOrderManager::setVisible(const std::string& layerId, bool visible) {
    LayerInfo* info = findLayer(layerId);
    if (!info) return false;
    info->visible = visible;
    info->modifiedAt = std::chrono::system_clock::now();
    return true;
}

bool ZOrderManager::setLocked(const std::string& layerId, bool locked) {
    LayerInfo* info = findLayer(layerId);
    if (!info) return false;
    info->locked = locked;
    info->modifiedAt = std::chrono::system_clock::now();
    return true;
}

//=============================================================================
// Reordering
//=============================================================================

std::vector<std::string> ZOrderManager::siblingsOf(const LayerInfo& info) const {
    std::vector<std::string> out;
    auto it = _pageLayers.find(info.page);
    if (it == _pageLayers.end()) return out;
    for (const auto& id : it->second) {
        if (!_config.maintainLevelBoundaries || _layers.at(id).level == info.level) {
            out.push_back(id);
        }
    }
    return out;
}

void ZOrderManager::restack(const std::vector<std::string>& order, std::vector<LayerChange>& changes) {
    if (order.empty()) return;
    const LayerInfo& first = _layers.at(order.front());
    const int page = first.page;
    const LayerLevel level = first.level;
    const auto now = std::chrono::system_clock::now();

    int start = first.zOrder;
    int spacing = _config.zOrderStep;
    if (_config.maintainLevelBoundaries) {
        start = levelBase(level);
        if (order.size() > 1) {
            int room = (levelCeiling(level) - 1 - start) / static_cast<int>(order.size() - 1);
            if (room < 1) {
                ywarn("restack: {} layers do not fit in level {} on page {}",
                      order.size(), toString(level), page);
            }
            spacing = std::clamp(room, 1, _config.zOrderStep);
        }
    } else {
        for (const auto& id : order) start = std::min(start, _layers.at(id).zOrder);
    }

    int z = start;
    for (const auto& id : order) {
        LayerInfo& info = _layers.at(id);
        if (info.zOrder != z) {
            changes.push_back({info.id, info.zOrder, z, info.level, info.level});
            info.zOrder = z;
            info.modifiedAt = now;
        }
        z += spacing;
    }

    if (_config.maintainLevelBoundaries) {
        int top = z - spacing;
        _zCounters[{page, level}] = (top - start) / _config.zOrderStep + 1;
    }
    ydebug("restack page={} level={} layers={} spacing={}", page, toString(level), order.size(), spacing);
}

bool ZOrderManager::reorder(const std::string& layerId, ReorderOperation op,
                            std::vector<LayerChange>& changes) {
    LayerInfo* info = findLayer(layerId);
    if (!info || info->locked) return false;

    auto siblings = siblingsOf(*info);
    auto pos = std::find(siblings.begin(), siblings.end(), layerId);
    if (pos == siblings.end()) return false;
    const size_t idx = static_cast<size_t>(pos - siblings.begin());
    const size_t last = siblings.size() - 1;
    const auto now = std::chrono::system_clock::now();

    auto setZ = [&](LayerInfo& target, int z) {
        if (target.zOrder == z) return;
        changes.push_back({target.id, target.zOrder, z, target.level, target.level});
        target.zOrder = z;
        target.modifiedAt = now;
    };

    // Target stack order with the layer moved; used when plain z values cannot express it
    auto moved = [&](size_t to) {
        std::vector<std::string> order = siblings;
        order.erase(order.begin() + static_cast<std::ptrdiff_t>(idx));
        order.insert(order.begin() + static_cast<std::ptrdiff_t>(to), layerId);
        return order;
    };

    // True when no sibling other than a and b sits at z
    auto zFree = [&](int z, const LayerInfo& a, const LayerInfo& b) {
        return std::none_of(siblings.begin(), siblings.end(), [&](const std::string& id) {
            return id != a.id && id != b.id && _layers.at(id).zOrder == z;
        });
    };

    auto swapWith = [&](LayerInfo& other, size_t to) {
        int mine = info->zOrder;
        if (mine != other.zOrder && zFree(mine, *info, other) && zFree(other.zOrder, *info, other)) {
            setZ(*info, other.zOrder);
            setZ(other, mine);
        } else {
            restack(moved(to), changes);
        }
    };

    switch (op) {
        case ReorderOperation::ToFront:
            if (idx < last) {
                int z = _layers.at(siblings[last]).zOrder + _config.zOrderStep;
                if (_config.maintainLevelBoundaries && z >= levelCeiling(info->level)) {
                    restack(moved(last), changes);
                } else {
                    setZ(*info, z);
                }
            }
            break;
        case ReorderOperation::ToBack:
            if (idx > 0) {
                int z = _layers.at(siblings.front()).zOrder - _config.zOrderStep;
                if (_config.maintainLevelBoundaries && z < levelBase(info->level)) {
                    restack(moved(0), changes);
                } else {
                    setZ(*info, z);
                }
            }
            break;
        case ReorderOperation::Forward:
            if (idx < last) swapWith(_layers.at(siblings[idx + 1]), idx + 1);
            break;
        case ReorderOperation::Backward:
            if (idx > 0) swapWith(_layers.at(siblings[idx - 1]), idx - 1);
            break;
        case ReorderOperation::ToLevel:
        case ReorderOperation::Swap:
            ydebug("reorder: {} is not a single-layer stack move", toString(op));
            return false;
    }

    sortPage(info->page);
    return true;
}

bool ZOrderManager::bringToFront(const std::string& layerId) {
    std::vector<LayerChange> changes;
    if (!reorder(layerId, ReorderOperation::ToFront, changes)) return false;
    recordHistory(ReorderOperation::ToFront, layerId, std::move(changes));
    return true;
}

bool ZOrderManager::sendToBack(const std::string& layerId) {
    std::vector<LayerChange> changes;
    if (!reorder(layerId, ReorderOperation::ToBack, changes)) return false;
    recordHistory(ReorderOperation::ToBack, layerId, std::move(changes));
    return true;
}

bool ZOrderManager::bringForward(const std::string& layerId) {
    std::vector<LayerChange> changes;
    if (!reorder(layerId, ReorderOperation::Forward, changes)) return false;
    recordHistory(ReorderOperation::Forward, layerId, std::move(changes));
    return true;
}

bool ZOrderManager::sendBackward(const std::string& layerId) {
    std::vector<LayerChange> changes;
    if (!reorder(layerId, ReorderOperation::Backward, changes)) return false;
    recordHistory(ReorderOperation::Backward, layerId, std::move(changes));
    return true;
}

bool ZOrderManager::moveToLevel(const std::string& layerId, LayerLevel level) {
    LayerInfo* info = findLayer(layerId);
    if (!info || info->locked) return false;
    if (!_config.allowCrossLevelMovement) {
        ywarn("moveToLevel {}: cross-level movement is disabled", layerId);
        return false;
    }

    std::vector<LayerChange> changes;
    LayerChange change{layerId, info->zOrder, 0, info->level, level};
    change.newZ = nextZOrder(info->page, level);
    info->level = level;
    info->zOrder = change.newZ;
    info->modifiedAt = std::chrono::system_clock::now();
    changes.push_back(change);
    if (_config.maintainLevelBoundaries && info->zOrder >= levelCeiling(level)) {
        sortPage(info->page);
        restack(siblingsOf(*info), changes);
    }
    sortPage(info->page);

    recordHistory(ReorderOperation::ToLevel, layerId, std::move(changes));
    return true;
}

bool ZOrderManager::swapLayers(const std::string& layerId1, const std::string& layerId2) {
    LayerInfo* a = findLayer(layerId1);
    LayerInfo* b = findLayer(layerId2);
    if (!a || !b || a == b) return false;
    if (a->locked || b->locked) return false;
    if (a->page != b->page) {
        ywarn("swapLayers: {} and {} are on different pages", layerId1, layerId2);
        return false;
    }

    std::vector<LayerChange> changes;
    if (a->zOrder != b->zOrder) {
        changes.push_back({a->id, a->zOrder, b->zOrder, a->level, a->level});
        changes.push_back({b->id, b->zOrder, a->zOrder, b->level, b->level});
        std::swap(a->zOrder, b->zOrder);
        auto now = std::chrono::system_clock::now();
        a->modifiedAt = now;
        b->modifiedAt = now;
        sortPage(a->page);
    }

    recordHistory(ReorderOperation::Swap, layerId1, std::move(changes));
    return true;
}

//=============================================================================
// Collisions
//=============================================================================

CollisionInfo ZOrderManager::detectCollision(const std::string& layerId1, const std::string& layerId2) const {
    CollisionInfo result;
    result.layer1Id = layerId1;
    result.layer2Id = layerId2;

    const LayerInfo* a = layer(layerId1);
    const LayerInfo* b = layer(layerId2);
    if (!a || !b) return result;

    const double tol = _config.collisionTolerance;
    Rect overlap{std::max(a->bbox.x0, b->bbox.x0), std::max(a->bbox.y0, b->bbox.y0),
                 std::min(a->bbox.x1, b->bbox.x1), std::min(a->bbox.y1, b->bbox.y1)};

    if (overlap.x0 - tol >= overlap.x1 || overlap.y0 - tol >= overlap.y1) {
        return result;
    }

    double minArea = std::min(a->bbox.area(), b->bbox.area());
    if (minArea <= 0.0) minArea = 1.0;

    result.overlap = overlap;
    result.overlapArea = overlap.area();
    result.overlapPercentage = result.overlapArea / minArea * 100.0;

    bool identical = std::abs(a->bbox.x0 - b->bbox.x0) < tol &&
                     std::abs(a->bbox.y0 - b->bbox.y0) < tol &&
                     std::abs(a->bbox.x1 - b->bbox.x1) < tol &&
                     std::abs(a->bbox.y1 - b->bbox.y1) < tol;

    if (identical) {
        result.type = CollisionType::Identical;
    } else if (result.overlapPercentage >= 95.0) {
        result.type = CollisionType::Contains;
    } else if (result.overlapPercentage >= 50.0) {
        result.type = CollisionType::Full;
    } else {
        result.type = CollisionType::Partial;
    }
    return result;
}

std::vector<CollisionInfo> ZOrderManager::detectCollisions(int page, std::optional<LayerLevel> level) const {
    std::vector<CollisionInfo> out;
    auto layers = pageLayers(page, level);
    for (size_t i = 0; i < layers.size(); i++) {
        for (size_t j = i + 1; j < layers.size(); j++) {
            auto collision = detectCollision(layers[i].id, layers[j].id);
            if (collision.isCollision()) out.push_back(std::move(collision));
        }
    }
    return out;
}

bool ZOrderManager::hasCollision(const std::string& layerId) const {
    const LayerInfo* info = layer(layerId);
    if (!info) return false;
    auto it = _pageLayers.find(info->page);
    if (it == _pageLayers.end()) return false;
    for (const auto& other : it->second) {
        if (other != layerId && detectCollision(layerId, other).isCollision()) return true;
    }
    return false;
}

//=============================================================================
// Groups
//=============================================================================

std::optional<LayerGroup> ZOrderManager::createGroup(const std::string& name,
                                                     const std::vector<std::string>& layerIds) {
    LayerGroup group;
    for (const auto& id : layerIds) {
        if (_layers.count(id) && !group.contains(id)) group.layerIds.push_back(id);
    }
    if (group.layerIds.empty()) return std::nullopt;

    group.id = fmt::format("group-{}", _nextGroupId++);
    group.name = name.empty() ? fmt::format("Group_{}", group.id) : name;

    for (const auto& id : group.layerIds) {
        LayerInfo& info = _layers.at(id);
        if (info.groupId) {
            ywarn("Layer {} already belongs to group {}", id, *info.groupId);
            auto old = _groups.find(*info.groupId);
            if (old != _groups.end()) {
                auto& members = old->second.layerIds;
                members.erase(std::remove(members.begin(), members.end(), id), members.end());
            }
        }
        info.groupId = group.id;
    }

    _groups.emplace(group.id, group);
    return group;
}

bool ZOrderManager::dissolveGroup(const std::string& groupId) {
    auto it = _groups.find(groupId);
    if (it == _groups.end()) return false;
    for (const auto& id : it->second.layerIds) {
        if (LayerInfo* info = findLayer(id)) info->groupId.reset();
    }
    _groups.erase(it);
    return true;
}

bool ZOrderManager::setGroupLocked(const std::string& groupId, bool locked) {
    auto it = _groups.find(groupId);
    if (it == _groups.end()) return false;
    it->second.locked = locked;
    return true;
}

const LayerGroup* ZOrderManager::group(const std::string& groupId) const {
    auto it = _groups.find(groupId);
    return it != _groups.end() ? &it->second : nullptr;
}

const LayerGroup* ZOrderManager::layerGroup(const std::string& layerId) const {
    const LayerInfo* info = layer(layerId);
    if (!info || !info->groupId) return nullptr;
    return group(*info->groupId);
}

bool ZOrderManager::moveGroup(const std::string& groupId, ReorderOperation op) {
    auto it = _groups.find(groupId);
    if (it == _groups.end() || it->second.locked) return false;

    std::vector<LayerChange> changes;
    bool success = true;
    const auto members = it->second.layerIds;
    for (const auto& id : members) {
        if (!reorder(id, op, changes)) success = false;
    }
    recordHistory(op, groupId, std::move(changes));
    return success;
}

//=============================================================================
// History
//=============================================================================

void ZOrderManager::recordHistory(ReorderOperation op, const std::string& primaryId,
                                  std::vector<LayerChange> changes) {
    if (!_config.enableHistory || changes.empty()) return;

    // A new action drops the redo branch
    if (_historyPosition < static_cast<int>(_history.size()) - 1) {
        _history.resize(static_cast<size_t>(_historyPosition + 1));
    }

    _history.push_back({op, primaryId, std::move(changes), std::chrono::system_clock::now()});
    _historyPosition = static_cast<int>(_history.size()) - 1;

    while (_history.size() > _config.maxHistory) {
        _history.erase(_history.begin());
        _historyPosition--;
    }
}

void ZOrderManager::applyChanges(const std::vector<LayerChange>& changes, bool forward) {
    std::vector<int> pages;
    auto now = std::chrono::system_clock::now();

    auto apply = [&](const LayerChange& change) {
        LayerInfo* info = findLayer(change.layerId);
        if (!info) return;  // removed since
        info->zOrder = forward ? change.newZ : change.oldZ;
        info->level = forward ? change.newLevel : change.oldLevel;
        info->modifiedAt = now;
        if (std::find(pages.begin(), pages.end(), info->page) == pages.end()) {
            pages.push_back(info->page);
        }
    };

    // Undo walks backwards so a layer touched twice ends at its first old value
    if (forward) {
        for (const auto& change : changes) apply(change);
    } else {
        for (auto it = changes.rbegin(); it != changes.rend(); ++it) apply(*it);
    }

    for (int page : pages) sortPage(page);
}

bool ZOrderManager::canUndo() const {
    return _config.enableHistory && _historyPosition >= 0;
}

bool ZOrderManager::canRedo() const {
    return _config.enableHistory && _historyPosition < static_cast<int>(_history.size()) - 1;
}

bool ZOrderManager::undo() {
    if (!canUndo()) return false;
    applyChanges(_history[static_cast<size_t>(_historyPosition)].changes, false);
    _historyPosition--;
    return true;
}

bool ZOrderManager::redo() {
    if (!canRedo()) return false;
    _historyPosition++;
    applyChanges(_history[static_cast<size_t>(_historyPosition)].changes, true);
    return true;
}

void ZOrderManager::clearHistory() {
    _history.clear();
    _historyPosition = -1;
}

//=============================================================================
// Misc
//=============================================================================

ZOrderStatistics ZOrderManager::statistics() const {
    ZOrderStatistics stats;
    stats.totalLayers = _layers.size();
    stats.totalPages = _pageLayers.size();
    stats.totalGroups = _groups.size();
    for (const auto& [id, info] : _layers) {
        stats.layersByLevel[info.level]++;
        stats.layersByPage[info.page]++;
    }
    stats.historyEntries = _history.size();
    stats.historyPosition = _historyPosition;
    return stats;
}

std::vector<LayerStackEntry> ZOrderManager::layerStack(int page) const {
    std::vector<LayerStackEntry> out;
    for (const auto& info : pageLayers(page)) {
        out.push_back({info.zOrder, info.id, info.name, info.level});
    }
    return out;
}

std::string ZOrderManager::resolveConflict(const std::string& layerId1, const std::string& layerId2,
                                           bool preferNewer) {
    const LayerInfo* a = layer(layerId1);
    const LayerInfo* b = layer(layerId2);
    if (!a || !b) {
        if (a) return layerId1;
        if (b) return layerId2;
        return {};
    }

    const LayerInfo* newer = a;
    const LayerInfo* older = b;
    if (preferNewer && b->sequence > a->sequence) {
        newer = b;
        older = a;
    }

    if (newer->zOrder <= older->zOrder) {
        bringForward(newer->id);
    }
    return newer->id;
}

void ZOrderManager::clear() {
    _layers.clear();
    _pageLayers.clear();
    _groups.clear();
    _zCounters.clear();
    clearHistory();
}

} // namespace retext
