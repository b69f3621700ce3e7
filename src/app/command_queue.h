#pragma once

#include "app/tools.h"
#include "core/color.h"
#include "core/image_op.h"
#include "core/rect.h"
#include "core/rgba_image.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>

namespace pix
{
// A user intent produced by input handling or menus, consumed once per frame.
struct Command
{
    enum class Kind : std::uint8_t
    {
        SelectTool = 0,
        SetPrimaryColor,
        SetSecondaryColor,
        ApplyImageOp,
        UndoImageOp,
        RedoImageOp,
        NewImage,
        SwitchImage,
        ResizeImage,
        ResizeCanvas,
        SetSelection,
        NewLayer,
        DuplicateLayer,
        DeleteLayer,
        SetActiveLayer,
        SetLayerVisible,
        CopySelection,
        CutSelection,
        DeleteSelection,
        Paste,
        MoveSelection,
        ScaleSelection,
        RotateSelection,
    };

    Kind kind = Kind::UndoImageOp;

    ToolKind            tool = ToolKind::Pencil;
    Color               color;
    ImageOp             op;
    int                 width = 0;
    int                 height = 0;
    std::optional<Rect> selection;
    Point               point;
    float               angle = 0.0f;
    std::size_t         layer = 0;
    bool                visible = true;
    std::string         path;
    RgbaImage           image;

    static Command SelectTool(ToolKind t);
    static Command SetPrimaryColor(const Color& c);
    static Command SetSecondaryColor(const Color& c);
    static Command ApplyImageOp(ImageOp op);
    static Command Undo();
    static Command Redo();
    // Transparent when `background` is not given.
    static Command NewImage(int width, int height, std::optional<Color> background = std::nullopt);
    // Replaces the document with a decoded file.
    static Command SwitchImage(std::string path, RgbaImage image);
    static Command ResizeImage(int width, int height);
    static Command ResizeCanvas(int width, int height);
    // nullopt clears the selection.
    static Command SetSelection(std::optional<Rect> selection);
    static Command NewLayer();
    static Command DuplicateLayer();
    // Deletes the active layer.
    static Command DeleteLayer();
    static Command SetActiveLayer(std::size_t layer);
    static Command SetLayerVisible(std::size_t layer, bool visible);

    // Selection editing on the active layer. All but copy are undoable.
    static Command CopySelection();
    static Command CutSelection();
    static Command DeleteSelection();
    // Pastes the last copied pixels with their top-left corner at `at`.
    static Command Paste(Point at);
    // Moves the selected pixels so their top-left corner lands on `to`.
    static Command MoveSelection(Point to);
    static Command ScaleSelection(const Rect& to);
    static Command RotateSelection(float radians);
};

const char* ToString(Command::Kind k);

// FIFO of pending commands.
class CommandQueue
{
public:
    void Push(Command c) { queue_.push_back(std::move(c)); }

    // Pops the oldest command; false when the queue is empty.
    bool Poll(Command& out)
    {
        if (queue_.empty())
            return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    std::size_t Size() const { return queue_.size(); }
    bool        Empty() const { return queue_.empty(); }
    void        Clear() { queue_.clear(); }

private:
    std::deque<Command> queue_;
};
} // namespace pix
