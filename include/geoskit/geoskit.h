// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "geometry.h"
#include "library.h"
#include "status.h"

namespace geoskit {

// Every operation below runs on its own GEOS session, created for the call
// and torn down before it returns, so operations may be called concurrently
// from any number of threads on the same GeosLibrary. lib must be non-null.
//
// Operations whose result is optional (Intersection, Difference,
// SymmetricDifference, Buffer, BufferWithStyle, OffsetCurve) set *ret to
// nullptr when GEOS returns a result with too few points to form a shape,
// e.g. the intersection of two disjoint polygons. Every other operation
// reports that case as a TooFewPoints status.

// kDefaultQuadrantSegments is the number of segments used to approximate a
// quarter circle when buffering.
const int kDefaultQuadrantSegments = 8;

enum class BufferEndCap { kRound = 1, kFlat = 2, kSquare = 3 };
enum class BufferJoin { kRound = 1, kMitre = 2, kBevel = 3 };

struct BufferStyle {
  BufferStyle()
      : quadrant_segments(kDefaultQuadrantSegments),
        end_cap(BufferEndCap::kRound),
        join(BufferJoin::kRound),
        mitre_limit(5.0) {}

  int quadrant_segments;
  BufferEndCap end_cap;
  BufferJoin join;
  double mitre_limit;
};

struct OffsetCurveStyle {
  OffsetCurveStyle()
      : quadrant_segments(kDefaultQuadrantSegments), join(BufferJoin::kBevel), mitre_limit(5.0) {}

  int quadrant_segments;
  BufferJoin join;
  double mitre_limit;
};

// MakeValidMethod selects the algorithm MakeValid uses. kLinework builds
// valid geometries from all the input's edges. kStructure rebuilds polygons
// from their rings and optionally keeps components that collapse to lower
// dimensions.
struct MakeValidMethod {
  enum Algorithm { kLinework, kStructure };

  static MakeValidMethod Linework() { return MakeValidMethod(kLinework, false); }
  static MakeValidMethod Structure(bool keep_collapsed) {
    return MakeValidMethod(kStructure, keep_collapsed);
  }

  Algorithm algorithm;
  bool keep_collapsed;

 private:
  MakeValidMethod(Algorithm algorithm, bool keep_collapsed)
      : algorithm(algorithm), keep_collapsed(keep_collapsed) {}
};

//
// Measurement.
//

Status Length(GeosLibrary* lib, const Geometry& g, double* ret);
Status Area(GeosLibrary* lib, const Geometry& g, double* ret);
Status Distance(GeosLibrary* lib, const Geometry& a, const Geometry& b, double* ret);
Status HausdorffDistance(GeosLibrary* lib, const Geometry& a, const Geometry& b, double* ret);
// densify_fraction splits each segment into equal parts of this fraction of
// its length before computing the distance.
Status HausdorffDistanceDensify(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                                double densify_fraction, double* ret);
// NearestPoints returns the point on a nearest to b followed by the point on
// b nearest to a.
Status NearestPoints(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                     std::vector<Point>* ret);

//
// Validity checking.
//

Status IsEmpty(GeosLibrary* lib, const Geometry& g, bool* ret);
Status IsRing(GeosLibrary* lib, const Geometry& g, bool* ret);
Status IsValid(GeosLibrary* lib, const Geometry& g, bool* ret);
Status IsValidReason(GeosLibrary* lib, const Geometry& g, std::string* ret);
// IsValidDetail reports validity along with the reason and location of the
// first problem found. With allow_self_touching_ring_forming_hole, a ring
// that touches itself to enclose a hole is considered valid.
Status IsValidDetail(GeosLibrary* lib, const Geometry& g,
                     bool allow_self_touching_ring_forming_hole, ValidityDetail* ret);

//
// Binary predicates.
//

Status IsTopologicallyEquivalent(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                                 bool* ret);
Status IsDisjoint(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret);
Status Touches(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret);
Status Intersects(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret);
Status Crosses(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret);
Status IsWithin(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret);
Status Contains(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret);
Status Overlaps(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret);
Status Covers(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret);
Status IsCovered(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret);

// Relate matches the DE-9IM relationship between a and b against mask, nine
// characters from {0, 1, 2, T, F, *}. A malformed mask is InvalidArgument.
Status Relate(GeosLibrary* lib, const Geometry& a, const Geometry& b, const std::string& mask,
              bool* ret);
// Relate returns the full DE-9IM matrix between a and b.
Status Relate(GeosLibrary* lib, const Geometry& a, const Geometry& b, std::string* ret);

//
// Topology operations.
//

// GetEnvelope returns the bounding box of g.
Status GetEnvelope(GeosLibrary* lib, const Geometry& g, Envelope* ret);
Status Intersection(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                    std::unique_ptr<Geometry>* ret);
Status Difference(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                  std::unique_ptr<Geometry>* ret);
Status SymmetricDifference(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                           std::unique_ptr<Geometry>* ret);
Status Union(GeosLibrary* lib, const Geometry& a, const Geometry& b, Geometry* ret);
Status UnaryUnion(GeosLibrary* lib, const Geometry& g, Geometry* ret);
Status ConvexHull(GeosLibrary* lib, const Geometry& g, Geometry* ret);
// ConcaveHull computes a concave hull whose edge lengths are bounded by
// ratio (0 to 1) of the longest edge of the convex hull.
Status ConcaveHull(GeosLibrary* lib, const Geometry& g, double ratio, bool allow_holes,
                   Geometry* ret);
Status MinimumRotatedRectangle(GeosLibrary* lib, const Geometry& g, Geometry* ret);
// MinimumWidth returns the line segment spanning the minimum width of g.
Status MinimumWidth(GeosLibrary* lib, const Geometry& g, LineString* ret);
Status PointOnSurface(GeosLibrary* lib, const Geometry& g, Point* ret);
Status Centroid(GeosLibrary* lib, const Geometry& g, Point* ret);
// MinimumBoundingCircle fails with NoMinimumBoundingCircle if GEOS reports
// success without a center.
Status MinimumBoundingCircle(GeosLibrary* lib, const Geometry& g, Circle* ret);
// Polygonize builds the polygons formed by the linework of geometries.
Status Polygonize(GeosLibrary* lib, const std::vector<Geometry>& geometries,
                  GeometryCollection* ret);
Status Polygonize(GeosLibrary* lib, const Geometry& g, GeometryCollection* ret);
Status LineMerge(GeosLibrary* lib, const Geometry& g, Geometry* ret);
// LineMergeDirected merges lines only where their directions agree.
Status LineMergeDirected(GeosLibrary* lib, const Geometry& g, Geometry* ret);
Status Buffer(GeosLibrary* lib, const Geometry& g, double width, std::unique_ptr<Geometry>* ret);
Status Buffer(GeosLibrary* lib, const Geometry& g, double width, int quadrant_segments,
              std::unique_ptr<Geometry>* ret);
Status BufferWithStyle(GeosLibrary* lib, const Geometry& g, double width,
                       const BufferStyle& style, std::unique_ptr<Geometry>* ret);
Status OffsetCurve(GeosLibrary* lib, const Geometry& g, double width,
                   const OffsetCurveStyle& style, std::unique_ptr<Geometry>* ret);
Status Simplify(GeosLibrary* lib, const Geometry& g, double tolerance, Geometry* ret);
Status TopologyPreserveSimplify(GeosLibrary* lib, const Geometry& g, double tolerance,
                                Geometry* ret);
// Snap snaps the vertices and segments of g to the vertices of to within
// tolerance.
Status Snap(GeosLibrary* lib, const Geometry& g, const Geometry& to, double tolerance,
            Geometry* ret);
// Normalized returns g in GEOS normal form: rings and members ordered and
// oriented canonically.
Status Normalized(GeosLibrary* lib, const Geometry& g, Geometry* ret);
Status MakeValid(GeosLibrary* lib, const Geometry& g, Geometry* ret);
Status MakeValid(GeosLibrary* lib, const Geometry& g, const MakeValidMethod& method,
                 Geometry* ret);

//
// Prepared geometries.
//

class Context;
class GeosObject;

// A PreparedGeometry holds g and a GEOS index over it, so repeated
// predicates against g avoid rebuilding the index. It owns its own GEOS
// session and must not be used from more than one thread at a time.
class PreparedGeometry {
 public:
  ~PreparedGeometry();

  Status Contains(const Geometry& other, bool* ret) const;
  Status ContainsProperly(const Geometry& other, bool* ret) const;
  Status CoveredBy(const Geometry& other, bool* ret) const;
  Status Covers(const Geometry& other, bool* ret) const;
  Status Crosses(const Geometry& other, bool* ret) const;
  Status Disjoint(const Geometry& other, bool* ret) const;
  Status Intersects(const Geometry& other, bool* ret) const;
  Status Overlaps(const Geometry& other, bool* ret) const;
  Status Touches(const Geometry& other, bool* ret) const;
  Status Within(const Geometry& other, bool* ret) const;

 private:
  friend Status MakePrepared(GeosLibrary* lib, const Geometry& g,
                             std::unique_ptr<PreparedGeometry>* ret);

  typedef char (*PredicateFn)(void*, void*, void*);

  PreparedGeometry(std::unique_ptr<Context> ctx, std::unique_ptr<GeosObject> base,
                   void* prepared);
  PreparedGeometry(const PreparedGeometry&) = delete;
  PreparedGeometry& operator=(const PreparedGeometry&) = delete;

  Status Evaluate(PredicateFn fn, const Geometry& other, bool* ret) const;

  // Destroyed in reverse order: the prepared geometry, then its base, then
  // the session.
  std::unique_ptr<Context> ctx_;
  std::unique_ptr<GeosObject> base_;
  void* prepared_;
};

Status MakePrepared(GeosLibrary* lib, const Geometry& g, std::unique_ptr<PreparedGeometry>* ret);

}  // namespace geoskit
