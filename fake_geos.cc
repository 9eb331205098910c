// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "fake_geos.h"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>

namespace testutils {

namespace {

struct FakeHandle {
  FakeHandle() : error_handler(nullptr), error_data(nullptr), notice_handler(nullptr),
                 notice_data(nullptr) {}

  GEOSKIT_MessageHandler error_handler;
  void* error_data;
  GEOSKIT_MessageHandler notice_handler;
  void* notice_data;
};

struct FakeCoordSeq {
  unsigned int size() const { return xyz.size() / 3; }

  unsigned int dims;
  std::vector<double> xyz;
};

struct FakeGeometry {
  int type;
  // Coordinates of a point, line string or linear ring.
  FakeCoordSeq* seq;
  // The rings of a polygon, shell first, or the members of a collection.
  std::vector<FakeGeometry*> children;
};

struct FakePrepared {
  FakeGeometry* base;
};

struct Bounds {
  Bounds()
      : min_x(std::numeric_limits<double>::infinity()),
        max_x(-std::numeric_limits<double>::infinity()),
        min_y(std::numeric_limits<double>::infinity()),
        max_y(-std::numeric_limits<double>::infinity()) {}

  bool empty() const { return min_x > max_x; }

  double min_x, max_x, min_y, max_y;
};

FakeGeosBehavior behavior;
FakeGeosCounters counters;

FakeGeometry* AsGeom(GEOSKIT_Geometry g) { return static_cast<FakeGeometry*>(g); }
FakeCoordSeq* AsSeq(GEOSKIT_CoordSeq seq) { return static_cast<FakeCoordSeq*>(seq); }

void ReportError(GEOSKIT_Handle h, const std::string& msg) {
  auto handle = static_cast<FakeHandle*>(h);
  if (handle->error_handler != nullptr) {
    handle->error_handler(msg.c_str(), handle->error_data);
  }
}

void ReportNotice(GEOSKIT_Handle h, const std::string& msg) {
  auto handle = static_cast<FakeHandle*>(h);
  if (handle->notice_handler != nullptr) {
    handle->notice_handler(msg.c_str(), handle->notice_data);
  }
}

FakeCoordSeq* NewSeq(unsigned int size, unsigned int dims) {
  counters.coord_seqs_created++;
  auto seq = new FakeCoordSeq;
  seq->dims = dims;
  seq->xyz.assign(size * 3, std::numeric_limits<double>::quiet_NaN());
  return seq;
}

void DeleteSeq(FakeCoordSeq* seq) {
  counters.coord_seqs_destroyed++;
  delete seq;
}

FakeGeometry* NewGeom(int type, FakeCoordSeq* seq) {
  counters.geometries_created++;
  auto g = new FakeGeometry;
  g->type = type;
  g->seq = seq;
  return g;
}

void DeleteGeom(FakeGeometry* g) {
  for (auto child : g->children) {
    DeleteGeom(child);
  }
  if (g->seq != nullptr) {
    DeleteSeq(g->seq);
  }
  counters.geometries_destroyed++;
  delete g;
}

FakeGeometry* Clone(const FakeGeometry* g) {
  FakeCoordSeq* seq = nullptr;
  if (g->seq != nullptr) {
    seq = NewSeq(g->seq->size(), g->seq->dims);
    seq->xyz = g->seq->xyz;
  }
  auto clone = NewGeom(g->type, seq);
  for (auto child : g->children) {
    clone->children.push_back(Clone(child));
  }
  return clone;
}

FakeGeometry* NewPointGeom(double x, double y) {
  auto seq = NewSeq(1, 2);
  seq->xyz[0] = x;
  seq->xyz[1] = y;
  return NewGeom(GEOSKIT_POINT, seq);
}

FakeGeometry* NewEmptyPolygon() {
  auto polygon = NewGeom(GEOSKIT_POLYGON, nullptr);
  polygon->children.push_back(NewGeom(GEOSKIT_LINEARRING, NewSeq(0, 2)));
  return polygon;
}

bool IsLeaf(const FakeGeometry* g) { return g->seq != nullptr; }

bool IsCollection(const FakeGeometry* g) { return g->type >= GEOSKIT_MULTIPOINT; }

void Extend(const FakeGeometry* g, Bounds* b) {
  if (IsLeaf(g)) {
    for (unsigned int i = 0; i < g->seq->size(); i++) {
      b->min_x = std::min(b->min_x, g->seq->xyz[i * 3]);
      b->max_x = std::max(b->max_x, g->seq->xyz[i * 3]);
      b->min_y = std::min(b->min_y, g->seq->xyz[i * 3 + 1]);
      b->max_y = std::max(b->max_y, g->seq->xyz[i * 3 + 1]);
    }
  }
  for (auto child : g->children) {
    Extend(child, b);
  }
}

double RingArea(const FakeGeometry* ring) {
  const auto& xyz = ring->seq->xyz;
  double sum = 0;
  for (unsigned int i = 0; i + 1 < ring->seq->size(); i++) {
    sum += xyz[i * 3] * xyz[(i + 1) * 3 + 1] - xyz[(i + 1) * 3] * xyz[i * 3 + 1];
  }
  return std::fabs(sum) / 2;
}

double AreaOf(const FakeGeometry* g) {
  if (g->type == GEOSKIT_POLYGON) {
    double area = RingArea(g->children[0]);
    for (size_t i = 1; i < g->children.size(); i++) {
      area -= RingArea(g->children[i]);
    }
    return area;
  }
  double area = 0;
  if (IsCollection(g)) {
    for (auto child : g->children) {
      area += AreaOf(child);
    }
  }
  return area;
}

double LengthOf(const FakeGeometry* g) {
  double length = 0;
  if (IsLeaf(g)) {
    const auto& xyz = g->seq->xyz;
    for (unsigned int i = 0; i + 1 < g->seq->size(); i++) {
      length += std::hypot(xyz[(i + 1) * 3] - xyz[i * 3], xyz[(i + 1) * 3 + 1] - xyz[i * 3 + 1]);
    }
  }
  for (auto child : g->children) {
    length += LengthOf(child);
  }
  return length;
}

bool Empty(const FakeGeometry* g) {
  if (IsLeaf(g)) {
    return g->seq->size() == 0;
  }
  if (g->type == GEOSKIT_POLYGON) {
    return Empty(g->children[0]);
  }
  return g->children.empty();
}

char PredicateResult(GEOSKIT_Handle h) {
  if (behavior.predicate_notice != nullptr) {
    ReportNotice(h, behavior.predicate_notice);
  }
  if (behavior.predicate_result == 2) {
    ReportError(h, "IllegalArgumentException: fake predicate failure");
  }
  return behavior.predicate_result;
}

//
// Entry points.
//

GEOSKIT_Handle Init() {
  if (behavior.init_fails) {
    return nullptr;
  }
  counters.handles_created++;
  return new FakeHandle;
}

void Finish(GEOSKIT_Handle h) {
  counters.handles_finished++;
  delete static_cast<FakeHandle*>(h);
}

GEOSKIT_MessageHandler SetErrorHandler(GEOSKIT_Handle h, GEOSKIT_MessageHandler fn, void* data) {
  auto handle = static_cast<FakeHandle*>(h);
  auto prev = handle->error_handler;
  handle->error_handler = fn;
  handle->error_data = data;
  return prev;
}

GEOSKIT_MessageHandler SetNoticeHandler(GEOSKIT_Handle h, GEOSKIT_MessageHandler fn, void* data) {
  auto handle = static_cast<FakeHandle*>(h);
  auto prev = handle->notice_handler;
  handle->notice_handler = fn;
  handle->notice_data = data;
  return prev;
}

void Free(GEOSKIT_Handle, void* buffer) {
  if (buffer != nullptr) {
    counters.buffers_freed++;
    free(buffer);
  }
}

char* NewBuffer(const char* str) {
  counters.buffers_created++;
  return strdup(str);
}

void GeomDestroy(GEOSKIT_Handle, GEOSKIT_Geometry g) { DeleteGeom(AsGeom(g)); }

int GeomTypeId(GEOSKIT_Handle, GEOSKIT_Geometry g) { return AsGeom(g)->type; }

char HasZ(GEOSKIT_Handle, GEOSKIT_Geometry g) {
  auto geom = AsGeom(g);
  while (!IsLeaf(geom)) {
    if (geom->children.empty()) {
      return 0;
    }
    geom = geom->children[0];
  }
  return geom->seq->dims == 3 ? 1 : 0;
}

char IsEmpty(GEOSKIT_Handle, GEOSKIT_Geometry g) { return Empty(AsGeom(g)) ? 1 : 0; }

GEOSKIT_CoordSeq CoordSeqCreate(GEOSKIT_Handle, unsigned int size, unsigned int dims) {
  return NewSeq(size, dims);
}

void CoordSeqDestroy(GEOSKIT_Handle, GEOSKIT_CoordSeq seq) { DeleteSeq(AsSeq(seq)); }

int CoordSeqSetXYZ(GEOSKIT_Handle h, GEOSKIT_CoordSeq s, unsigned int idx, double x, double y,
                   double z) {
  auto seq = AsSeq(s);
  if (idx >= seq->size()) {
    ReportError(h, "IllegalArgumentException: coordinate index out of bounds");
    return 0;
  }
  seq->xyz[idx * 3] = x;
  seq->xyz[idx * 3 + 1] = y;
  seq->xyz[idx * 3 + 2] = z;
  return 1;
}

int CoordSeqSetXY(GEOSKIT_Handle h, GEOSKIT_CoordSeq s, unsigned int idx, double x, double y) {
  return CoordSeqSetXYZ(h, s, idx, x, y, std::numeric_limits<double>::quiet_NaN());
}

int CoordSeqGetXYZ(GEOSKIT_Handle h, GEOSKIT_CoordSeq s, unsigned int idx, double* x, double* y,
                   double* z) {
  auto seq = AsSeq(s);
  if (idx >= seq->size()) {
    ReportError(h, "IllegalArgumentException: coordinate index out of bounds");
    return 0;
  }
  *x = seq->xyz[idx * 3];
  *y = seq->xyz[idx * 3 + 1];
  *z = seq->xyz[idx * 3 + 2];
  return 1;
}

int CoordSeqGetXY(GEOSKIT_Handle h, GEOSKIT_CoordSeq s, unsigned int idx, double* x, double* y) {
  double z = 0;
  return CoordSeqGetXYZ(h, s, idx, x, y, &z);
}

int CoordSeqGetSize(GEOSKIT_Handle, GEOSKIT_CoordSeq s, unsigned int* size) {
  *size = AsSeq(s)->size();
  return 1;
}

GEOSKIT_CoordSeq GeomGetCoordSeq(GEOSKIT_Handle h, GEOSKIT_Geometry g) {
  auto geom = AsGeom(g);
  if (!IsLeaf(geom)) {
    ReportError(h, "IllegalArgumentException: geometry has no coordinate sequence");
    return nullptr;
  }
  return geom->seq;
}

GEOSKIT_Geometry CreatePoint(GEOSKIT_Handle h, GEOSKIT_CoordSeq s) {
  auto seq = AsSeq(s);
  if (seq->size() > 1) {
    ReportError(h, "IllegalArgumentException: Point coordinate list must contain a single element");
    DeleteSeq(seq);
    return nullptr;
  }
  return NewGeom(GEOSKIT_POINT, seq);
}

GEOSKIT_Geometry CreateLineString(GEOSKIT_Handle h, GEOSKIT_CoordSeq s) {
  auto seq = AsSeq(s);
  if (seq->size() == 1) {
    ReportError(h, "IllegalArgumentException: point array must contain 0 or >1 elements");
    DeleteSeq(seq);
    return nullptr;
  }
  return NewGeom(GEOSKIT_LINESTRING, seq);
}

GEOSKIT_Geometry CreateLinearRing(GEOSKIT_Handle h, GEOSKIT_CoordSeq s) {
  auto seq = AsSeq(s);
  if (seq->size() > 0 && seq->size() < 4) {
    ReportError(h, fmt::format("IllegalArgumentException: Invalid number of points in LinearRing "
                               "found {} - must be 0 or >= 4",
                               seq->size()));
    DeleteSeq(seq);
    return nullptr;
  }
  return NewGeom(GEOSKIT_LINEARRING, seq);
}

GEOSKIT_Geometry CreatePolygon(GEOSKIT_Handle, GEOSKIT_Geometry shell, GEOSKIT_Geometry* holes,
                               unsigned int nholes) {
  auto polygon = NewGeom(GEOSKIT_POLYGON, nullptr);
  polygon->children.push_back(AsGeom(shell));
  for (unsigned int i = 0; i < nholes; i++) {
    polygon->children.push_back(AsGeom(holes[i]));
  }
  return polygon;
}

GEOSKIT_Geometry CreateCollection(GEOSKIT_Handle, int type, GEOSKIT_Geometry* geoms,
                                  unsigned int ngeoms) {
  auto collection = NewGeom(type, nullptr);
  for (unsigned int i = 0; i < ngeoms; i++) {
    collection->children.push_back(AsGeom(geoms[i]));
  }
  return collection;
}

GEOSKIT_Geometry GetExteriorRing(GEOSKIT_Handle h, GEOSKIT_Geometry g) {
  auto geom = AsGeom(g);
  if (geom->type != GEOSKIT_POLYGON) {
    ReportError(h, "IllegalArgumentException: Argument is not a Polygon");
    return nullptr;
  }
  return geom->children[0];
}

int GetNumInteriorRings(GEOSKIT_Handle h, GEOSKIT_Geometry g) {
  auto geom = AsGeom(g);
  if (geom->type != GEOSKIT_POLYGON) {
    ReportError(h, "IllegalArgumentException: Argument is not a Polygon");
    return -1;
  }
  return geom->children.size() - 1;
}

GEOSKIT_Geometry GetInteriorRingN(GEOSKIT_Handle, GEOSKIT_Geometry g, int n) {
  return AsGeom(g)->children[n + 1];
}

int GetNumGeometries(GEOSKIT_Handle, GEOSKIT_Geometry g) {
  auto geom = AsGeom(g);
  return IsCollection(geom) ? geom->children.size() : 1;
}

GEOSKIT_Geometry GetGeometryN(GEOSKIT_Handle, GEOSKIT_Geometry g, int n) {
  auto geom = AsGeom(g);
  return IsCollection(geom) ? geom->children[n] : geom;
}

int Area(GEOSKIT_Handle h, GEOSKIT_Geometry g, double* ret) {
  if (behavior.scalar_fails) {
    ReportError(h, "TopologyException: fake area failure");
    return 0;
  }
  *ret = AreaOf(AsGeom(g));
  return 1;
}

int Length(GEOSKIT_Handle h, GEOSKIT_Geometry g, double* ret) {
  if (behavior.scalar_fails) {
    ReportError(h, "TopologyException: fake length failure");
    return 0;
  }
  *ret = LengthOf(AsGeom(g));
  return 1;
}

// Distance between the first coordinates of a and b.
int Distance(GEOSKIT_Handle h, GEOSKIT_Geometry a, GEOSKIT_Geometry b, double* ret) {
  if (behavior.scalar_fails) {
    ReportError(h, "TopologyException: fake distance failure");
    return 0;
  }
  Bounds ba, bb;
  Extend(AsGeom(a), &ba);
  Extend(AsGeom(b), &bb);
  *ret = std::hypot(ba.min_x - bb.min_x, ba.min_y - bb.min_y);
  return 1;
}

char UnaryPredicate(GEOSKIT_Handle h, GEOSKIT_Geometry) { return PredicateResult(h); }

char BinaryPredicate(GEOSKIT_Handle h, GEOSKIT_Geometry, GEOSKIT_Geometry) {
  return PredicateResult(h);
}

char RelatePattern(GEOSKIT_Handle h, GEOSKIT_Geometry, GEOSKIT_Geometry, const char*) {
  return PredicateResult(h);
}

char* IsValidReason(GEOSKIT_Handle, GEOSKIT_Geometry) { return NewBuffer("Valid Geometry"); }

char IsValidDetail(GEOSKIT_Handle h, GEOSKIT_Geometry, int, char** reason,
                   GEOSKIT_Geometry* location) {
  if (behavior.valid_detail_reason) {
    *reason = NewBuffer("Self-intersection");
  }
  if (behavior.valid_detail_location) {
    *location = NewPointGeom(1, 1);
  }
  if (behavior.valid_detail_result == 2) {
    ReportError(h, "TopologyException: fake validity failure");
  }
  return behavior.valid_detail_result;
}

GEOSKIT_Geometry Union(GEOSKIT_Handle h, GEOSKIT_Geometry a, GEOSKIT_Geometry b) {
  for (auto g : {AsGeom(a), AsGeom(b)}) {
    if (g->type == GEOSKIT_POINT && g->seq->size() > 0 && g->seq->xyz[0] < 0) {
      ReportError(h, fmt::format("union: negative x {}", g->seq->xyz[0]));
      return nullptr;
    }
  }
  bool points = AsGeom(a)->type == GEOSKIT_POINT && AsGeom(b)->type == GEOSKIT_POINT;
  auto result = NewGeom(points ? GEOSKIT_MULTIPOINT : GEOSKIT_GEOMETRYCOLLECTION, nullptr);
  result->children.push_back(Clone(AsGeom(a)));
  result->children.push_back(Clone(AsGeom(b)));
  return result;
}

GEOSKIT_Geometry Intersection(GEOSKIT_Handle, GEOSKIT_Geometry a, GEOSKIT_Geometry b) {
  Bounds ba, bb;
  Extend(AsGeom(a), &ba);
  Extend(AsGeom(b), &bb);
  if (ba.empty() || bb.empty() || ba.max_x < bb.min_x || bb.max_x < ba.min_x ||
      ba.max_y < bb.min_y || bb.max_y < ba.min_y) {
    return NewEmptyPolygon();
  }
  return Clone(AsGeom(a));
}

GEOSKIT_Geometry Envelope(GEOSKIT_Handle, GEOSKIT_Geometry g) {
  Bounds b;
  Extend(AsGeom(g), &b);
  if (b.empty()) {
    return NewGeom(GEOSKIT_POINT, NewSeq(0, 2));
  }
  if (b.min_x == b.max_x && b.min_y == b.max_y) {
    return NewPointGeom(b.min_x, b.min_y);
  }
  auto ring = NewSeq(5, 2);
  double coords[] = {b.min_x, b.min_y, b.max_x, b.min_y, b.max_x,
                     b.max_y, b.min_x, b.max_y, b.min_x, b.min_y};
  for (unsigned int i = 0; i < 5; i++) {
    ring->xyz[i * 3] = coords[i * 2];
    ring->xyz[i * 3 + 1] = coords[i * 2 + 1];
  }
  auto polygon = NewGeom(GEOSKIT_POLYGON, nullptr);
  polygon->children.push_back(NewGeom(GEOSKIT_LINEARRING, ring));
  return polygon;
}

GEOSKIT_Geometry Buffer(GEOSKIT_Handle, GEOSKIT_Geometry g, double width, int) {
  auto geom = AsGeom(g);
  if (width == 0 && geom->type == GEOSKIT_POLYGON && AreaOf(geom) == 0) {
    return NewEmptyPolygon();
  }
  return Clone(geom);
}

GEOSKIT_Geometry MinimumBoundingCircle(GEOSKIT_Handle h, GEOSKIT_Geometry, double* radius,
                                       GEOSKIT_Geometry* center) {
  *radius = 5;
  if (behavior.mbc_center) {
    *center = NewPointGeom(0, 0);
  }
  if (!behavior.mbc_geometry) {
    ReportError(h, "TopologyException: fake circle failure");
    return nullptr;
  }
  return NewPointGeom(0, 0);
}

GEOSKIT_Geometry Polygonize(GEOSKIT_Handle, const GEOSKIT_Geometry* geoms, unsigned int ngeoms) {
  auto result = NewGeom(GEOSKIT_GEOMETRYCOLLECTION, nullptr);
  for (unsigned int i = 0; i < ngeoms; i++) {
    result->children.push_back(Clone(AsGeom(geoms[i])));
  }
  return result;
}

int Normalize(GEOSKIT_Handle h, GEOSKIT_Geometry) {
  if (behavior.normalize_fails) {
    ReportError(h, "IllegalStateException: fake normalize failure");
    return -1;
  }
  return 0;
}

GEOSKIT_PreparedGeometry Prepare(GEOSKIT_Handle, GEOSKIT_Geometry g) {
  counters.prepared_created++;
  auto prepared = new FakePrepared;
  prepared->base = AsGeom(g);
  return prepared;
}

void PreparedDestroy(GEOSKIT_Handle, GEOSKIT_PreparedGeometry p) {
  counters.prepared_destroyed++;
  delete static_cast<FakePrepared*>(p);
}

char PreparedPredicate(GEOSKIT_Handle h, GEOSKIT_PreparedGeometry, GEOSKIT_Geometry) {
  return PredicateResult(h);
}

geoskit::GeosLibrary* NewFakeLibrary() {
  auto lib = new geoskit::GeosLibrary();
  lib->GEOS_init_r = Init;
  lib->GEOS_finish_r = Finish;
  lib->GEOSContext_setErrorMessageHandler_r = SetErrorHandler;
  lib->GEOSContext_setNoticeMessageHandler_r = SetNoticeHandler;
  lib->GEOSFree_r = Free;
  lib->GEOSGeom_destroy_r = GeomDestroy;
  lib->GEOSGeomTypeId_r = GeomTypeId;
  lib->GEOSHasZ_r = HasZ;
  lib->GEOSCoordSeq_create_r = CoordSeqCreate;
  lib->GEOSCoordSeq_destroy_r = CoordSeqDestroy;
  lib->GEOSCoordSeq_setXY_r = CoordSeqSetXY;
  lib->GEOSCoordSeq_setXYZ_r = CoordSeqSetXYZ;
  lib->GEOSCoordSeq_getXY_r = CoordSeqGetXY;
  lib->GEOSCoordSeq_getXYZ_r = CoordSeqGetXYZ;
  lib->GEOSCoordSeq_getSize_r = CoordSeqGetSize;
  lib->GEOSGeom_getCoordSeq_r = GeomGetCoordSeq;
  lib->GEOSGeom_createPoint_r = CreatePoint;
  lib->GEOSGeom_createLineString_r = CreateLineString;
  lib->GEOSGeom_createLinearRing_r = CreateLinearRing;
  lib->GEOSGeom_createPolygon_r = CreatePolygon;
  lib->GEOSGeom_createCollection_r = CreateCollection;
  lib->GEOSGetExteriorRing_r = GetExteriorRing;
  lib->GEOSGetNumInteriorRings_r = GetNumInteriorRings;
  lib->GEOSGetInteriorRingN_r = GetInteriorRingN;
  lib->GEOSGetNumGeometries_r = GetNumGeometries;
  lib->GEOSGetGeometryN_r = GetGeometryN;
  lib->GEOSArea_r = Area;
  lib->GEOSLength_r = Length;
  lib->GEOSDistance_r = Distance;
  lib->GEOSisEmpty_r = IsEmpty;
  lib->GEOSisRing_r = UnaryPredicate;
  lib->GEOSisValid_r = UnaryPredicate;
  lib->GEOSisValidReason_r = IsValidReason;
  lib->GEOSisValidDetail_r = IsValidDetail;
  lib->GEOSEquals_r = BinaryPredicate;
  lib->GEOSDisjoint_r = BinaryPredicate;
  lib->GEOSTouches_r = BinaryPredicate;
  lib->GEOSIntersects_r = BinaryPredicate;
  lib->GEOSCrosses_r = BinaryPredicate;
  lib->GEOSWithin_r = BinaryPredicate;
  lib->GEOSContains_r = BinaryPredicate;
  lib->GEOSOverlaps_r = BinaryPredicate;
  lib->GEOSCovers_r = BinaryPredicate;
  lib->GEOSCoveredBy_r = BinaryPredicate;
  lib->GEOSRelatePattern_r = RelatePattern;
  lib->GEOSEnvelope_r = Envelope;
  lib->GEOSIntersection_r = Intersection;
  lib->GEOSUnion_r = Union;
  lib->GEOSMinimumBoundingCircle_r = MinimumBoundingCircle;
  lib->GEOSPolygonize_r = Polygonize;
  lib->GEOSNormalize_r = Normalize;
  lib->GEOSBuffer_r = Buffer;
  lib->GEOSPrepare_r = Prepare;
  lib->GEOSPreparedGeom_destroy_r = PreparedDestroy;
  lib->GEOSPreparedContains_r = PreparedPredicate;
  lib->GEOSPreparedIntersects_r = PreparedPredicate;
  return lib;
}

}  // namespace

int FakeGeosCounters::Live() const {
  return (handles_created - handles_finished) + (geometries_created - geometries_destroyed) +
         (coord_seqs_created - coord_seqs_destroyed) + (buffers_created - buffers_freed) +
         (prepared_created - prepared_destroyed);
}

geoskit::GeosLibrary* FakeGeosLibrary() {
  static geoskit::GeosLibrary* lib = NewFakeLibrary();
  return lib;
}

FakeGeosBehavior* FakeBehavior() { return &behavior; }

FakeGeosCounters* FakeCounters() { return &counters; }

void ResetFakeGeos() {
  behavior = FakeGeosBehavior();
  for (auto counter :
       {&counters.handles_created, &counters.handles_finished, &counters.geometries_created,
        &counters.geometries_destroyed, &counters.coord_seqs_created,
        &counters.coord_seqs_destroyed, &counters.buffers_created, &counters.buffers_freed,
        &counters.prepared_created, &counters.prepared_destroyed}) {
    counter->store(0);
  }
}

}  // namespace testutils
