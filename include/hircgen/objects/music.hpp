/**
 * @file music.hpp
 * @brief インタラクティブミュージック（セグメント、トラック）
 */
#ifndef HIRCGEN_OBJECTS_MUSIC_HPP
#define HIRCGEN_OBJECTS_MUSIC_HPP

#include "hircgen/objects/containers.hpp"
#include <string>
#include <vector>

namespace hircgen {

/**
 * @brief ミュージックセグメント
 *
 * トラックを子に持つ。スティンガーとトランジションは副オブジェクトとして
 * 登録され、ルートの描画が終わった後に個別に生成される。
 *
 * ノード形式: CAkMusicSegment { sid ID; child ID; stinger ID; transition ID; }
 */
class MusicSegmentObject : public ChildListObject {
public:
    std::string name() const override { return "CAkMusicSegment"; }
    void render(RenderScope& scope) const override;

protected:
    void parse_props(const Node& node) override;

private:
    std::vector<uint32_t> stingers_;
    std::vector<uint32_t> transitions_;
};

/**
 * @brief ミュージックトラック（0個以上のソース）
 *
 * ノード形式: CAkMusicTrack { sid ID; source ID [name="..."]; ... }
 */
class MusicTrackObject : public HircObject {
public:
    std::string name() const override { return "CAkMusicTrack"; }
    void render(RenderScope& scope) const override;

protected:
    void parse_props(const Node& node) override;

private:
    std::vector<std::string> sources_;
};

} // namespace hircgen

#endif // HIRCGEN_OBJECTS_MUSIC_HPP
