#include "hydro-mesh/src/Mesh/MeshCache.hpp"

#include <initializer_list>

namespace hydro_mesh
{

namespace
{

CachedPropertySet propertySet(std::initializer_list<CachedProperty> properties)
{
  CachedPropertySet set;
  for (const auto property : properties)
  {
    set.set(static_cast<size_t>(property));
  }
  return set;
}

}  // namespace

CachedPropertySet MeshCache::invalidatedBy(MeshChange change)
{
  switch (change)
  {
    case MeshChange::VerticesReplaced:
    case MeshChange::FacesReplaced:
      return CachedPropertySet{}.set();
    case MeshChange::RigidMotion:
      // Normals and centers are rotated / translated in place, radii are
      // invariant under rigid motion
      return propertySet({CachedProperty::SurfaceIntegrals});
    case MeshChange::VertexPositions:
      return propertySet({CachedProperty::FaceGeometry,
                          CachedProperty::FaceRadii,
                          CachedProperty::SurfaceIntegrals});
    case MeshChange::Winding:
      return propertySet(
        {CachedProperty::FaceGeometry, CachedProperty::Connectivity});
    case MeshChange::GlobalFlip:
      // Boundary loops follow face winding
      return propertySet({CachedProperty::Connectivity});
    case MeshChange::VertexRenumbering:
      return propertySet({CachedProperty::Connectivity});
  }
  return CachedPropertySet{}.set();
}

void MeshCache::apply(MeshChange change)
{
  invalidate(invalidatedBy(change));
}

void MeshCache::invalidate(CachedProperty property)
{
  switch (property)
  {
    case CachedProperty::FaceClassification:
      faceClassification.reset();
      break;
    case CachedProperty::FaceGeometry:
      faceGeometry.reset();
      break;
    case CachedProperty::FaceRadii:
      faceRadii.reset();
      break;
    case CachedProperty::Connectivity:
      connectivity.reset();
      break;
    case CachedProperty::SurfaceIntegrals:
      surfaceIntegrals.reset();
      break;
    case CachedProperty::Count:
      break;
  }
}

void MeshCache::invalidate(const CachedPropertySet& properties)
{
  for (size_t i = 0; i < kCachedPropertyCount; ++i)
  {
    if (properties.test(i))
    {
      invalidate(static_cast<CachedProperty>(i));
    }
  }
}

void MeshCache::clear()
{
  faceClassification.reset();
  faceGeometry.reset();
  faceRadii.reset();
  connectivity.reset();
  surfaceIntegrals.reset();
}

bool MeshCache::has(CachedProperty property) const
{
  switch (property)
  {
    case CachedProperty::FaceClassification:
      return faceClassification.has_value();
    case CachedProperty::FaceGeometry:
      return faceGeometry.has_value();
    case CachedProperty::FaceRadii:
      return faceRadii.has_value();
    case CachedProperty::Connectivity:
      return connectivity.has_value();
    case CachedProperty::SurfaceIntegrals:
      return surfaceIntegrals.has_value();
    case CachedProperty::Count:
      break;
  }
  return false;
}

CachedPropertySet MeshCache::cached() const
{
  CachedPropertySet set;
  for (size_t i = 0; i < kCachedPropertyCount; ++i)
  {
    set.set(i, has(static_cast<CachedProperty>(i)));
  }
  return set;
}

std::string_view toString(CachedProperty property)
{
  switch (property)
  {
    case CachedProperty::FaceClassification:
      return "FaceClassification";
    case CachedProperty::FaceGeometry:
      return "FaceGeometry";
    case CachedProperty::FaceRadii:
      return "FaceRadii";
    case CachedProperty::Connectivity:
      return "Connectivity";
    case CachedProperty::SurfaceIntegrals:
      return "SurfaceIntegrals";
    case CachedProperty::Count:
      break;
  }
  return "Unknown";
}

}  // namespace hydro_mesh
