// Blackbody multidimensional array header

#ifndef ARRAY_H_
#define ARRAY_H_

//--------------------------------------------------------------------------------------------------

// Multidimensional array
// Notes:
//   Data are stored with n1 as the fastest-varying (innermost) dimension.
//   n_dim records the rank the array was allocated with, with 0 meaning a single scalar value.
//   Copies are shallow aliases that never free the data; moves transfer ownership.
template<typename type>
struct Array
{
  // Constructors and destructor
  Array();
  explicit Array(int n1_);
  Array(int n2_, int n1_);
  Array(int n3_, int n2_, int n1_);
  Array(int n4_, int n3_, int n2_, int n1_);
  Array(int n5_, int n4_, int n3_, int n2_, int n1_);
  Array(const Array<type> &source);
  Array(Array<type> &&source) noexcept;
  Array &operator=(const Array<type> &source);
  Array &operator=(Array<type> &&source) noexcept;
  ~Array();

  // Data
  type *data = nullptr;
  int n1 = 0, n2 = 0, n3 = 0, n4 = 0, n5 = 0;
  int n_dim = 0;
  long int n_tot = 0;
  bool allocated = false;
  bool is_copy = false;
  static constexpr int max_dims = 5;

  // Functions - allocators and deallocator
  void Allocate();
  void AllocateScalar();
  void Allocate(int n1_);
  void Allocate(int n2_, int n1_);
  void Allocate(int n3_, int n2_, int n1_);
  void Allocate(int n4_, int n3_, int n2_, int n1_);
  void Allocate(int n5_, int n4_, int n3_, int n2_, int n1_);
  void AllocateShape(int n_dim_, const int *shape);
  void Deallocate();

  // Functions - read accessors
  type operator()(int i1_) const;
  type operator()(int i2_, int i1_) const;
  type operator()(int i3_, int i2_, int i1_) const;
  type operator()(int i4_, int i3_, int i2_, int i1_) const;
  type operator()(int i5_, int i4_, int i3_, int i2_, int i1_) const;

  // Functions - read/write accessors
  type &operator()(int i1_);
  type &operator()(int i2_, int i1_);
  type &operator()(int i3_, int i2_, int i1_);
  type &operator()(int i4_, int i3_, int i2_, int i1_);
  type &operator()(int i5_, int i4_, int i3_, int i2_, int i1_);

  // Functions - shape
  bool IsScalar() const;
  int GetDim(int axis) const;
  void GetShape(int *shape) const;
  void Reshape(int n_dim_, const int *shape);

  // Functions - miscellaneous
  void Fill(type value);
  void SetNaN();
};

//--------------------------------------------------------------------------------------------------

// Specializations
template<> void Array<double>::SetNaN();

#endif
