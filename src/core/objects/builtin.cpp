#include "hircgen/hirc_object.hpp"
#include "hircgen/objects/actions.hpp"
#include "hircgen/objects/containers.hpp"
#include "hircgen/objects/music.hpp"

namespace hircgen {

namespace {
template<typename T>
HircObjectPtr make_object() {
    return std::make_shared<T>();
}
}  // namespace

const ObjectTable& builtin_object_table() {
    static const ObjectTable table = {
        {"CAkEvent", &make_object<EventObject>},
        {"CAkActionPlay", &make_object<ActionPlayObject>},
        {"CAkSwitchCntr", &make_object<SwitchContainerObject>},
        {"CAkRanSeqCntr", &make_object<RanSeqContainerObject>},
        {"CAkLayerCntr", &make_object<LayerContainerObject>},
        {"CAkSound", &make_object<SoundObject>},
        {"CAkMusicSegment", &make_object<MusicSegmentObject>},
        {"CAkMusicTrack", &make_object<MusicTrackObject>},
    };
    return table;
}

const std::vector<std::string>& builtin_root_types() {
    static const std::vector<std::string> types = {"CAkEvent"};
    return types;
}

const std::vector<std::string>& builtin_unused_types() {
    static const std::vector<std::string> types = {
        "CAkMusicSegment",
        "CAkSwitchCntr",
        "CAkRanSeqCntr",
        "CAkLayerCntr",
        "CAkMusicTrack",
        "CAkSound",
    };
    return types;
}

const std::set<std::string>& builtin_silent_types() {
    static const std::set<std::string> types = {"CAkMusicSegment"};
    return types;
}

} // namespace hircgen
