#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tc {

// User-created annotations anchored in (time, price) space. Times are epoch
// seconds (fractional allowed: a click between two candles keeps its spot).
enum class AnnotationKind : std::uint8_t {
  HorizontalLine = 1, // single price level, full width
  Trendline = 2,      // (time, price) -> (time1, price1)
  Text = 3,           // label at (time, price)
  Brush = 4           // free-hand stroke through `points`
};

const char* toString(AnnotationKind kind);
bool parseAnnotationKind(const std::string& s, AnnotationKind& out);

struct AnnotationPoint {
  double time{0};
  double price{0};
};

struct Annotation {
  std::uint32_t id{0};
  AnnotationKind kind{AnnotationKind::HorizontalLine};

  double price{0};
  double time{0};
  double time1{0}, price1{0};          // Trendline second anchor
  std::string text;                    // Text
  std::vector<AnnotationPoint> points; // Brush

  float color[4] = {0.16f, 0.38f, 1.0f, 1.0f};  // #2962ff
  float lineWidth{2.0f};
  std::int64_t createdAt{0};  // epoch millis
};

class AnnotationStore {
public:
  using Clock = std::function<std::int64_t()>;  // epoch millis

  AnnotationStore();

  // Tests inject a fixed clock for stable createdAt values.
  void setClock(Clock clock) { clock_ = std::move(clock); }
  void setDefaultColor(const float rgba[4]);

  std::uint32_t addHorizontalLine(double price, double time = 0);
  std::uint32_t addTrendline(double time0, double price0, double time1, double price1);
  std::uint32_t addText(double time, double price, const std::string& text);
  // Returns 0 (nothing stored) for strokes with fewer than 2 points.
  std::uint32_t addBrush(const std::vector<AnnotationPoint>& points);

  bool setColor(std::uint32_t id, float r, float g, float b, float a);
  bool remove(std::uint32_t id);
  void clear();

  const Annotation* get(std::uint32_t id) const;
  const std::vector<Annotation>& annotations() const { return annotations_; }
  std::size_t count() const { return annotations_.size(); }

  // Bumped on every mutation; renderers compare it to skip rebuilds.
  std::uint64_t revision() const { return revision_; }

  std::string toJSON() const;
  // Replaces the contents. Returns false (store unchanged) on malformed input.
  bool loadJSON(const std::string& json);
  // Takes other's annotations and id counter; keeps this store's clock and
  // bumps its revision. other is left empty.
  void adopt(AnnotationStore&& other);

private:
  Annotation& push(AnnotationKind kind);

  std::vector<Annotation> annotations_;
  std::uint32_t nextId_{1};
  std::uint64_t revision_{0};
  float defaultColor_[4] = {0.16f, 0.38f, 1.0f, 1.0f};
  Clock clock_;
};

} // namespace tc
