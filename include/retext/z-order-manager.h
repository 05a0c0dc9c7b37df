#pragma once

#include <retext/geometry.h>
#include <retext/result.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace retext {

class Config;

//=============================================================================
// LayerLevel - semantic stacking ladder; the value is the level's base z
//=============================================================================
enum class LayerLevel : int {
    Background = 0,
    Redaction = 100,
    ContentBase = 200,
    Fill = 300,
    Stroke = 350,
    TextBackground = 380,
    Text = 400,
    TextDecoration = 450,
    Highlight = 500,
    Annotation = 600,
    Markup = 700,
    Foreground = 800,
    Overlay = 900,
    UI = 1000,
};

inline int levelBase(LayerLevel level) { return static_cast<int>(level); }
const char* toString(LayerLevel level);

// Highest level whose base is <= z
LayerLevel levelFromZ(int z);

// "redaction", "text_background", "underline", ... ; unknown names map to Text
LayerLevel levelForSourceType(std::string_view sourceType);

enum class CollisionType {
    None,
    Partial,
    Full,       // >= 50% of the smaller area
    Contains,   // >= 95% of the smaller area
    Identical,  // all four edges within tolerance
};

enum class ReorderOperation {
    ToFront,
    ToBack,
    Forward,
    Backward,
    ToLevel,
    Swap,
};

const char* toString(CollisionType type);
const char* toString(ReorderOperation op);

using Timestamp = std::chrono::system_clock::time_point;

struct LayerInfo {
    std::string id;
    std::string name;
    int page = 0;
    LayerLevel level = LayerLevel::Text;
    int zOrder = 0;
    Rect bbox;
    std::optional<std::string> groupId;
    std::optional<std::string> parentId;
    bool visible = true;
    bool locked = false;
    Timestamp createdAt;
    Timestamp modifiedAt;
    std::string sourceType;
    std::string sourceId;
    uint64_t sequence = 0;  // insertion order, breaks z ties

    bool containsPoint(double x, double y) const { return bbox.contains(x, y); }
};

struct CollisionInfo {
    std::string layer1Id;
    std::string layer2Id;
    CollisionType type = CollisionType::None;
    std::optional<Rect> overlap;
    double overlapArea = 0.0;
    double overlapPercentage = 0.0;  // of the smaller bbox

    bool isCollision() const { return type != CollisionType::None; }
};

struct LayerGroup {
    std::string id;
    std::string name;
    std::vector<std::string> layerIds;
    bool locked = false;

    size_t count() const { return layerIds.size(); }
    bool contains(const std::string& layerId) const;
};

struct LayerChange {
    std::string layerId;
    int oldZ = 0;
    int newZ = 0;
    LayerLevel oldLevel = LayerLevel::Text;
    LayerLevel newLevel = LayerLevel::Text;
};

struct ReorderHistoryEntry {
    ReorderOperation operation = ReorderOperation::Forward;
    std::string layerId;                // primary layer (or group id for group moves)
    std::vector<LayerChange> changes;   // every layer the operation touched
    Timestamp timestamp;
};

struct ZOrderConfig {
    bool maintainLevelBoundaries = true;
    bool allowCrossLevelMovement = false;
    size_t maxLayersPerPage = 1000;
    int zOrderStep = 10;
    bool enableHistory = true;
    size_t maxHistory = 100;
    double collisionTolerance = 0.5;

    static ZOrderConfig fromConfig(const Config& config);
};

struct ZOrderStatistics {
    size_t totalLayers = 0;
    size_t totalPages = 0;
    size_t totalGroups = 0;
    std::map<LayerLevel, size_t> layersByLevel;
    std::map<int, size_t> layersByPage;
    size_t historyEntries = 0;
    int historyPosition = -1;
};

struct LayerStackEntry {
    int zOrder;
    std::string id;
    std::string name;
    LayerLevel level;
};

//=============================================================================
// ZOrderManager
//
// Owns every layer of a document. Page stacks are kept sorted by
// (level, z, sequence) when level boundaries are maintained, otherwise by
// (z, sequence).
//=============================================================================
class ZOrderManager {
public:
    explicit ZOrderManager(ZOrderConfig config = {});

    const ZOrderConfig& config() const { return _config; }
    size_t layerCount() const { return _layers.size(); }
    size_t pageCount() const { return _pageLayers.size(); }

    //-------------------------------------------------------------------------
    // Layers
    //-------------------------------------------------------------------------
    Result<LayerInfo> addLayer(int page, const Rect& bbox, LayerLevel level = LayerLevel::Text,
                               const std::string& name = "", const std::string& sourceType = "",
                               const std::string& sourceId = "");
    bool removeLayer(const std::string& layerId);

    const LayerInfo* layer(const std::string& layerId) const;
    std::vector<LayerInfo> pageLayers(int page, std::optional<LayerLevel> level = std::nullopt,
                                      bool visibleOnly = false) const;
    std::vector<LayerInfo> allLayers() const;

    // Topmost first
    std::vector<LayerInfo> layersAtPoint(int page, double x, double y, bool visibleOnly = true) const;

    bool setVisible(const std::string& layerId, bool visible);
    bool setLocked(const std::string& layerId, bool locked);

    //-------------------------------------------------------------------------
    // Reordering (false for unknown or locked layers)
    //-------------------------------------------------------------------------
    bool bringToFront(const std::string& layerId);
    bool sendToBack(const std::string& layerId);
    bool bringForward(const std::string& layerId);
    bool sendBackward(const std::string& layerId);
    bool moveToLevel(const std::string& layerId, LayerLevel level);
    bool swapLayers(const std::string& layerId1, const std::string& layerId2);

    //-------------------------------------------------------------------------
    // Collisions
    //-------------------------------------------------------------------------
    CollisionInfo detectCollision(const std::string& layerId1, const std::string& layerId2) const;
    std::vector<CollisionInfo> detectCollisions(int page, std::optional<LayerLevel> level = std::nullopt) const;
    bool hasCollision(const std::string& layerId) const;

    //-------------------------------------------------------------------------
    // Groups
    //-------------------------------------------------------------------------
    std::optional<LayerGroup> createGroup(const std::string& name, const std::vector<std::string>& layerIds);
    bool dissolveGroup(const std::string& groupId);
    bool setGroupLocked(const std::string& groupId, bool locked);
    const LayerGroup* group(const std::string& groupId) const;
    const LayerGroup* layerGroup(const std::string& layerId) const;

    // Applies `op` (ToFront/ToBack/Forward/Backward) to every member; one history entry
    bool moveGroup(const std::string& groupId, ReorderOperation op);

    //-------------------------------------------------------------------------
    // History
    //-------------------------------------------------------------------------
    bool undo();
    bool redo();
    bool canUndo() const;
    bool canRedo() const;
    void clearHistory();
    const std::vector<ReorderHistoryEntry>& history() const { return _history; }

    //-------------------------------------------------------------------------
    // Misc
    //-------------------------------------------------------------------------
    ZOrderStatistics statistics() const;
    std::vector<LayerStackEntry> layerStack(int page) const;

    // Brings the newer layer (or layerId1 when !preferNewer) above the other.
    // Returns the id left on top, empty when neither layer exists.
    std::string resolveConflict(const std::string& layerId1, const std::string& layerId2,
                                bool preferNewer = true);

    void clear();

private:
    LayerInfo* findLayer(const std::string& layerId);
    int nextZOrder(int page, LayerLevel level);

    // Applies a reorder and appends what changed; no history
    bool reorder(const std::string& layerId, ReorderOperation op, std::vector<LayerChange>& changes);

    // Same-level siblings (or the whole page) in stack order
    std::vector<std::string> siblingsOf(const LayerInfo& layer) const;

    // Renumbers the layers in the given stack order at step spacing (narrower
    // when the level range is short); appends what changed
    void restack(const std::vector<std::string>& order, std::vector<LayerChange>& changes);

    bool orderedBefore(const LayerInfo& a, const LayerInfo& b) const;
    void sortPage(int page);
    void recordHistory(ReorderOperation op, const std::string& primaryId, std::vector<LayerChange> changes);
    void applyChanges(const std::vector<LayerChange>& changes, bool forward);

    ZOrderConfig _config;
    std::map<std::string, LayerInfo> _layers;
    std::map<int, std::vector<std::string>> _pageLayers;
    std::map<std::string, LayerGroup> _groups;
    std::map<std::pair<int, LayerLevel>, int> _zCounters;

    std::vector<ReorderHistoryEntry> _history;
    int _historyPosition = -1;

    uint64_t _nextSequence = 0;
    uint64_t _nextLayerId = 1;
    uint64_t _nextGroupId = 1;
};

} // namespace retext
