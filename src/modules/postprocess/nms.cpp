#include "vdet/postprocess.hpp"
#include <algorithm>
namespace vdet {
float IoU(const cv::Rect2f& a, const cv::Rect2f& b){
  float x1=std::max(a.x,b.x), y1=std::max(a.y,b.y);
  float x2=std::min(a.x+a.width,b.x+b.width), y2=std::min(a.y+a.height,b.y+b.height);
  float inter = std::max(0.f,x2-x1) * std::max(0.f,y2-y1);
  float ua = a.area() + b.area() - inter;
  return ua > 0.f ? inter/ua : 0.f;
}
RawDetections NMS(const RawDetections& ds, float thr){
  auto sorted=ds;
  std::stable_sort(sorted.begin(), sorted.end(),[](const RawDetection& a,const RawDetection& b){return a.confidence>b.confidence;});
  std::vector<int> keep; std::vector<char> sup(sorted.size(),0);
  for(size_t i=0;i<sorted.size();++i){ if(sup[i]) continue; keep.push_back((int)i);
    for(size_t j=i+1;j<sorted.size();++j){
      if(sorted[i].label==sorted[j].label && IoU(sorted[i].box,sorted[j].box)>thr) sup[j]=1; } }
  RawDetections out; out.reserve(keep.size()); for(int i: keep) out.push_back(sorted[i]); return out;
}
}
